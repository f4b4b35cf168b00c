// Copyright (c) 2018 nyorain
// Distributed under the Boost Software License, Version 1.0.
// See accompanying file LICENSE or copy at http://www.boost.org/LICENSE_1_0.txt

#include <vpath/curves.hpp>
#include <nytl/vecOps.hpp>
#include <nytl/math.hpp>
#include <dlg/dlg.hpp>

#include <algorithm>
#include <cmath>
#include <stdexcept>

// https://svgwg.org/svg2-draft/paths.html#DProperty
// https://www.w3.org/TR/SVG11/paths.html#PathElement

namespace vpath {
namespace {

/// 2-dimensional cross product.
/// Is the same as the dot of a with the normal of b.
template<typename T>
constexpr T cross(nytl::Vec<2, T> a, nytl::Vec<2, T> b) {
	return a[0] * b[1] - a[1] * b[0];
}

/// Rotates the given vector counter-clockwise by the angle with
/// the given sin and cos.
Vec2f rotate(Vec2f v, float cosa, float sina) {
	return {cosa * v.x - sina * v.y, sina * v.x + cosa * v.y};
}

void checkTolerance(const FlattenSettings& settings) {
	if(!(settings.tolerance > 0.f)) {
		dlg_warn("Invalid flattening tolerance {}", settings.tolerance);
		throw std::invalid_argument("vpath: flattening tolerance must be positive");
	}
}

} // anon namespace

Vec2f mirror(Vec2f center, Vec2f point) {
	return center + (center - point);
}

// stackoverflow.com/questions/3162645/convert-a-quadratic-bezier-to-a-cubic
CubicBezier quadToCubic(const QuadBezier& b) {
	return {b.start,
		b.start + (2 / 3.f) * (b.control - b.start),
		b.end + (2 / 3.f) * (b.control - b.end),
		b.end};
}

Vec2f eval(const QuadBezier& b, float t) {
	auto mt = 1 - t;
	return (mt * mt) * b.start + (2 * mt * t) * b.control + (t * t) * b.end;
}

Vec2f eval(const CubicBezier& b, float t) {
	auto mt = 1 - t;
	return (mt * mt * mt) * b.start +
		(3 * mt * mt * t) * b.control1 +
		(3 * mt * t * t) * b.control2 +
		(t * t * t) * b.end;
}

Vec2f eval(const CenterArc& arc, float angle) {
	auto p = Vec2f{arc.radius.x * std::cos(angle), arc.radius.y * std::sin(angle)};
	return arc.center + rotate(p, std::cos(arc.xRotation), std::sin(arc.xRotation));
}

/// Simple Paul de Casteljau implementation.
/// See antigrain.com/research/adaptive_bezier/
std::pair<CubicBezier, CubicBezier> subdivide(const CubicBezier& bezier) {
	auto p1 = bezier.start;
	auto p2 = bezier.control1;
	auto p3 = bezier.control2;
	auto p4 = bezier.end;

	auto p12 = 0.5f * (p1 + p2);
	auto p23 = 0.5f * (p2 + p3);
	auto p34 = 0.5f * (p3 + p4);
	auto p123 = 0.5f * (p12 + p23);
	auto p234 = 0.5f * (p23 + p34);
	auto p1234 = 0.5f * (p123 + p234);

	return {{p1, p12, p123, p1234}, {p1234, p234, p34, p4}};
}

// The distance between B(t) and the chord point (1 - t) * p1 + t * p4
// is t(1 - t)|(1 - t)u + tv| <= |max(u, v)| / 4 per component.
bool flat(const CubicBezier& b, float tolerance) {
	auto u = 3.f * b.control1 - 2.f * b.start - b.end;
	auto v = 3.f * b.control2 - b.start - 2.f * b.end;

	auto dx = std::max(u.x * u.x, v.x * v.x);
	auto dy = std::max(u.y * u.y, v.y * v.y);
	return dx + dy <= 16.f * tolerance * tolerance;
}

// Arc implementations from
// www.w3.org/TR/SVG/implnote.html#ArcImplementationNotes
std::optional<CenterArc> centerArc(Vec2f from, Vec2f radii, float xRotation,
		ArcFlags flags, Vec2f to) {

	if(from == to) {
		return std::nullopt;
	}

	auto r = Vec2f{std::abs(radii.x), std::abs(radii.y)};
	if(r.x == 0.f || r.y == 0.f) {
		return std::nullopt;
	}

	auto cosr = std::cos(xRotation);
	auto sinr = std::sin(xRotation);

	// step 1 (p = (x', y'))
	auto p = rotate(0.5f * (from - to), cosr, -sinr);

	// make sure the radii are large enough
	auto pxs = p.x * p.x, pys = p.y * p.y;
	auto lambda = pxs / (r.x * r.x) + pys / (r.y * r.y);
	if(lambda > 1.f) {
		r = std::sqrt(lambda) * r;
	}

	// step2 (tc = (cx', cy'))
	auto rxs = r.x * r.x, rys = r.y * r.y;
	auto inner = (rxs * rys - rxs * pys - rys * pxs) / (rxs * pys + rys * pxs);
	auto sign = (flags.largeArc != flags.sweep) ? 1.f : -1.f;
	auto mult = Vec2f{r.x * p.y / r.y, -r.y * p.x / r.x};
	auto tc = (sign * std::sqrt(std::max(inner, 0.f))) * mult;

	// step3: center
	auto c = rotate(tc, cosr, sinr) + 0.5f * (from + to);

	// step4: angles
	auto vec1 = Vec2f{(p.x - tc.x) / r.x, (p.y - tc.y) / r.y};
	auto vec2 = Vec2f{(-p.x - tc.x) / r.x, (-p.y - tc.y) / r.y};
	auto angle1 = std::atan2(vec1.y, vec1.x);
	auto delta = std::atan2(cross(vec1, vec2), dot(vec1, vec2));

	constexpr auto twoPi = 2 * nytl::constants::pi;
	if(!flags.sweep && delta > 0) {
		delta -= twoPi;
	} else if(flags.sweep && delta < 0) {
		delta += twoPi;
	}

	return CenterArc {c, r, xRotation, angle1, float(delta)};
}

// Each segment of at most a quarter turn is approximated by the
// cubic with control point distance 4/3 * tan(delta / 4) on the unit
// circle, then mapped onto the ellipse.
void toCubics(const CenterArc& arc, std::vector<CubicBezier>& curves) {
	constexpr auto quarter = 0.5f * nytl::constants::pi;
	auto count = std::max(1, int(std::ceil(std::abs(arc.sweep) / quarter - 0.001f)));
	auto delta = arc.sweep / count;
	auto k = (4 / 3.f) * std::tan(0.25f * delta);

	auto cosr = std::cos(arc.xRotation);
	auto sinr = std::sin(arc.xRotation);
	auto map = [&](Vec2f unit) {
		auto p = Vec2f{arc.radius.x * unit.x, arc.radius.y * unit.y};
		return arc.center + rotate(p, cosr, sinr);
	};

	curves.reserve(curves.size() + count);
	auto a0 = arc.start;
	for(auto i = 0; i < count; ++i) {
		auto a1 = a0 + delta;
		auto p0 = Vec2f{std::cos(a0), std::sin(a0)};
		auto p1 = Vec2f{std::cos(a1), std::sin(a1)};
		auto t0 = Vec2f{-p0.y, p0.x};
		auto t1 = Vec2f{-p1.y, p1.x};

		curves.push_back({map(p0), map(p0 + k * t0), map(p1 - k * t1), map(p1)});
		a0 = a1;
	}
}

// CurveFlattener
CurveFlattener::CurveFlattener(const CubicBezier& curve,
		const FlattenSettings& settings) :
			tolerance_(settings.tolerance), maxLevel_(settings.maxLevel) {
	checkTolerance(settings);
	stack_.push_back({curve, 0u});
}

CurveFlattener::CurveFlattener(const QuadBezier& curve,
	const FlattenSettings& settings) :
		CurveFlattener(quadToCubic(curve), settings) {
}

std::optional<Vec2f> CurveFlattener::next() {
	while(!stack_.empty()) {
		auto entry = stack_.back();
		stack_.pop_back();

		if(entry.level >= maxLevel_ || flat(entry.curve, tolerance_)) {
			return entry.curve.end;
		}

		// push the second half first, so the first one is handled next
		auto [first, second] = subdivide(entry.curve);
		stack_.push_back({second, entry.level + 1});
		stack_.push_back({first, entry.level + 1});
	}

	return std::nullopt;
}

void flatten(const CubicBezier& curve, const FlattenSettings& settings,
		std::vector<Vec2f>& points) {
	CurveFlattener flattener(curve, settings);
	while(auto p = flattener.next()) {
		points.push_back(*p);
	}
}

void flatten(const QuadBezier& curve, const FlattenSettings& settings,
		std::vector<Vec2f>& points) {
	flatten(quadToCubic(curve), settings, points);
}

} // namespace vpath
