// Copyright (c) 2018 nyorain
// Distributed under the Boost Software License, Version 1.0.
// See accompanying file LICENSE or copy at http://www.boost.org/LICENSE_1_0.txt

#include <vpath/path.hpp>
#include <vpath/error.hpp>
#include <nytl/vecOps.hpp>
#include <dlg/dlg.hpp>

#include <algorithm>
#include <ostream>
#include <stdexcept>
#include <type_traits>
#include <utility>

namespace vpath {

// Path
PathBuilder Path::builder() {
	return {};
}

EventIterator Path::iter() const {
	return EventIterator(*this);
}

FlatteningIterator Path::flattened(float tolerance) const {
	FlattenSettings settings;
	settings.tolerance = tolerance;
	return flattened(settings);
}

FlatteningIterator Path::flattened(const FlattenSettings& settings) const {
	return FlatteningIterator(iter(), settings);
}

const Vec2f& Path::point(std::size_t i) const {
	if(i >= points_.size()) {
		throw std::out_of_range("Path::point");
	}

	return points_[i];
}

std::size_t Path::subpathCount() const {
	return std::count(verbs_.begin(), verbs_.end(), Verb::begin);
}

Path Path::reversed() const {
	PathBuilder builder;
	builder.reserve(verbs_.size(), points_.size());

	// edges of the current subpath
	std::vector<PathEvent> edges;
	auto reverseEdge = [&](auto& e) {
		using T = std::decay_t<decltype(e)>;
		if constexpr(std::is_same_v<T, LineEvent>) {
			builder.lineTo(e.from);
		} else if constexpr(std::is_same_v<T, QuadraticEvent>) {
			builder.quadraticBezierTo(e.ctrl, e.from);
		} else if constexpr(std::is_same_v<T, CubicEvent>) {
			builder.cubicBezierTo(e.ctrl2, e.ctrl1, e.from);
		} else {
			dlg_error("Path::reversed: unexpected event {}", e);
		}
	};

	for(auto& event : iter()) {
		if(std::holds_alternative<BeginEvent>(event)) {
			edges.clear();
		} else if(auto* end = std::get_if<EndEvent>(&event)) {
			builder.moveTo(end->last);
			for(auto it = edges.rbegin(); it != edges.rend(); ++it) {
				std::visit(reverseEdge, *it);
			}

			if(end->close) {
				builder.close();
			}
		} else {
			edges.push_back(event);
		}
	}

	return builder.build();
}

bool Path::operator==(const Path& rhs) const {
	return verbs_ == rhs.verbs_ && points_ == rhs.points_;
}

std::ostream& operator<<(std::ostream& os, const Path& path) {
	os << "Path{";
	auto first = true;
	for(auto& event : path.iter()) {
		if(!first) {
			os << ", ";
		}

		os << event;
		first = false;
	}

	return os << "}";
}

// PathBuilder
void PathBuilder::moveTo(Vec2f to) {
	end();
	state_.begin(to);
	path_.verbs_.push_back(Verb::begin);
	path_.points_.push_back(to);
}

void PathBuilder::lineTo(Vec2f to) {
	state_.lineTo(to);
	path_.verbs_.push_back(Verb::line);
	path_.points_.push_back(to);
}

void PathBuilder::horizontalLineTo(float x) {
	state_.requireOpen("horizontalLineTo");
	lineTo({x, state_.current().y});
}

void PathBuilder::verticalLineTo(float y) {
	state_.requireOpen("verticalLineTo");
	lineTo({state_.current().x, y});
}

void PathBuilder::quadraticBezierTo(Vec2f ctrl, Vec2f to) {
	state_.requireOpen("quadraticBezierTo");
	state_.quadraticTo(ctrl, to);
	path_.verbs_.push_back(Verb::quadratic);
	path_.points_.push_back(ctrl);
	path_.points_.push_back(to);
}

void PathBuilder::cubicBezierTo(Vec2f ctrl1, Vec2f ctrl2, Vec2f to) {
	state_.requireOpen("cubicBezierTo");
	cubic(ctrl1, ctrl2, to);
}

void PathBuilder::smoothQuadraticBezierTo(Vec2f to) {
	state_.requireOpen("smoothQuadraticBezierTo");
	quadraticBezierTo(state_.smoothCtrl(), to);
}

void PathBuilder::smoothCubicBezierTo(Vec2f ctrl2, Vec2f to) {
	state_.requireOpen("smoothCubicBezierTo");
	cubic(state_.smoothCtrl(), ctrl2, to);
}

void PathBuilder::arcTo(Vec2f radii, float xRotation, ArcFlags flags, Vec2f to) {
	arc("arcTo", radii, xRotation, flags, to);
}

void PathBuilder::relativeMoveTo(Vec2f to) {
	moveTo(state_.relative(to));
}

void PathBuilder::relativeLineTo(Vec2f to) {
	state_.requireOpen("relativeLineTo");
	lineTo(state_.relative(to));
}

void PathBuilder::relativeQuadraticBezierTo(Vec2f ctrl, Vec2f to) {
	state_.requireOpen("relativeQuadraticBezierTo");
	quadraticBezierTo(state_.relative(ctrl), state_.relative(to));
}

void PathBuilder::relativeCubicBezierTo(Vec2f ctrl1, Vec2f ctrl2, Vec2f to) {
	state_.requireOpen("relativeCubicBezierTo");
	cubic(state_.relative(ctrl1), state_.relative(ctrl2), state_.relative(to));
}

void PathBuilder::relativeArcTo(Vec2f radii, float xRotation, ArcFlags flags,
		Vec2f to) {
	arc("relativeArcTo", radii, xRotation, flags, state_.relative(to));
}

void PathBuilder::close() {
	if(!state_.open()) {
		dlg_debug("PathBuilder::close: no open subpath, ignored");
		return;
	}

	state_.close();
	path_.verbs_.push_back(Verb::close);
}

void PathBuilder::polygon(nytl::Span<const Vec2f> points, bool closed) {
	if(points.size() == 0) {
		return;
	}

	reserve(points.size() + 1, points.size());
	moveTo(points[0]);
	for(auto i = 1u; i < points.size(); ++i) {
		lineTo(points[i]);
	}

	if(closed) {
		close();
	} else {
		end();
	}
}

void PathBuilder::append(const Path& path) {
	if(path.empty()) {
		return;
	}

	end();

	auto position = state_.current();
	for(auto& event : path.iter()) {
		if(auto* e = std::get_if<EndEvent>(&event)) {
			position = e->close ? e->first : e->last;
		}
	}

	auto& verbs = path_.verbs_;
	auto& points = path_.points_;
	verbs.insert(verbs.end(), path.verbs_.begin(), path.verbs_.end());
	points.insert(points.end(), path.points_.begin(), path.points_.end());
	state_.reset(position);
}

void PathBuilder::reserve(std::size_t verbs, std::size_t points) {
	path_.verbs_.reserve(path_.verbs_.size() + verbs);
	path_.points_.reserve(path_.points_.size() + points);
}

Path PathBuilder::build() {
	end();

	auto ret = std::move(path_);
	path_ = {};
	state_ = {};
	return ret;
}

void PathBuilder::end() {
	if(!state_.open()) {
		return;
	}

	dlg_debug("PathBuilder: ending open subpath at {}", state_.current());
	state_.end();
	path_.verbs_.push_back(Verb::end);
}

void PathBuilder::cubic(Vec2f ctrl1, Vec2f ctrl2, Vec2f to) {
	state_.cubicTo(ctrl1, ctrl2, to);
	path_.verbs_.push_back(Verb::cubic);
	path_.points_.push_back(ctrl1);
	path_.points_.push_back(ctrl2);
	path_.points_.push_back(to);
}

void PathBuilder::arc(const char* op, Vec2f radii, float xRotation,
		ArcFlags flags, Vec2f to) {

	state_.requireOpen(op);

	auto from = state_.current();
	if(from == to) {
		return;
	}

	auto center = centerArc(from, radii, xRotation, flags, to);
	if(!center) {
		dlg_debug("PathBuilder::{}: zero radius, adding line", op);
		lineTo(to);
		return;
	}

	std::vector<CubicBezier> curves;
	toCubics(*center, curves);
	dlg_assert(!curves.empty());

	// make sure the path ends exactly at the given point
	curves.back().end = to;
	for(auto& curve : curves) {
		cubic(curve.control1, curve.control2, curve.end);
	}
}

} // namespace vpath
