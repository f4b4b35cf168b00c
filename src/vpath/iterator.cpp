// Copyright (c) 2018 nyorain
// Distributed under the Boost Software License, Version 1.0.
// See accompanying file LICENSE or copy at http://www.boost.org/LICENSE_1_0.txt

#include <vpath/iterator.hpp>
#include <vpath/path.hpp>
#include <dlg/dlg.hpp>

#include <stdexcept>
#include <utility>

namespace vpath {

// EventIterator
EventIterator::EventIterator(const Path& path) : path_(&path) {
}

std::optional<PathEvent> EventIterator::next() {
	if(!path_ || verb_ >= path_->verbs_.size()) {
		return std::nullopt;
	}

	auto verb = path_->verbs_[verb_++];
	auto& points = path_->points_;
	dlg_assertm(point_ + pointCount(verb) <= points.size(),
		"Path: verb {} has no points left", verb);

	switch(verb) {
		case Verb::begin: {
			current_ = points[point_++];
			first_ = current_;
			return BeginEvent {current_};
		} case Verb::line: {
			auto from = current_;
			current_ = points[point_++];
			return LineEvent {from, current_};
		} case Verb::quadratic: {
			auto from = current_;
			auto ctrl = points[point_];
			current_ = points[point_ + 1];
			point_ += 2;
			return QuadraticEvent {from, ctrl, current_};
		} case Verb::cubic: {
			auto from = current_;
			auto ctrl1 = points[point_];
			auto ctrl2 = points[point_ + 1];
			current_ = points[point_ + 2];
			point_ += 3;
			return CubicEvent {from, ctrl1, ctrl2, current_};
		} case Verb::close: {
			auto last = current_;
			current_ = first_;
			return EndEvent {last, first_, true};
		} case Verb::end: {
			return EndEvent {current_, first_, false};
		}
	}

	dlg_error("EventIterator: invalid verb {}", int(verb));
	return std::nullopt;
}

// FlatteningIterator
FlatteningIterator::FlatteningIterator(EventIterator events,
		const FlattenSettings& settings) :
			events_(std::move(events)), settings_(settings) {

	if(!(settings.tolerance > 0.f)) {
		dlg_warn("FlatteningIterator: invalid tolerance {}", settings.tolerance);
		throw std::invalid_argument("vpath: flattening tolerance must be positive");
	}
}

std::optional<PathEvent> FlatteningIterator::next() {
	if(auto p = curve_.next()) {
		auto from = last_;
		last_ = *p;
		return LineEvent {from, *p};
	}

	auto event = events_.next();
	if(!event) {
		return std::nullopt;
	}

	// every curve produces at least one point
	if(auto* q = std::get_if<QuadraticEvent>(&*event)) {
		curve_ = CurveFlattener(QuadBezier {q->from, q->ctrl, q->to}, settings_);
		last_ = q->from;
		return next();
	} else if(auto* c = std::get_if<CubicEvent>(&*event)) {
		curve_ = CurveFlattener(CubicBezier {c->from, c->ctrl1, c->ctrl2, c->to},
			settings_);
		last_ = c->from;
		return next();
	}

	return event;
}

} // namespace vpath
