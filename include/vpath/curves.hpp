// Copyright (c) 2018 nyorain
// Distributed under the Boost Software License, Version 1.0.
// See accompanying file LICENSE or copy at http://www.boost.org/LICENSE_1_0.txt

#pragma once

#include <vpath/fwd.hpp>
#include <nytl/vec.hpp>

#include <optional>
#include <utility>
#include <vector>

namespace vpath {

/// All information needed to represent a quadratic bezier curve.
struct QuadBezier {
	Vec2f start;
	Vec2f control;
	Vec2f end;
};

/// All information needed to represent a cubic bezier curve.
struct CubicBezier {
	Vec2f start;
	Vec2f control1;
	Vec2f control2;
	Vec2f end;
};

/// Flags of an svg endpoint arc.
struct ArcFlags {
	bool largeArc {};
	bool sweep {}; // positive angle direction
};

/// Center parameterization of an elliptical arc.
/// Angles are in radians, measured in the (rotated) ellipse space.
/// The arc goes from 'start' to 'start + sweep'.
struct CenterArc {
	Vec2f center;
	Vec2f radius;
	float xRotation {};
	float start {};
	float sweep {};
};

/// Controls how curves are approximated by line segments.
struct FlattenSettings {
	/// Maximum distance between a curve and its polyline approximation.
	/// Must be greater than zero.
	float tolerance {0.1f};

	/// Maximum subdivision depth. A curve is never split into more than
	/// 2^maxLevel segments, even if the tolerance is not reached.
	unsigned maxLevel {16u};
};

/// Mirrors the given point on the given center.
Vec2f mirror(Vec2f center, Vec2f point);

// Exact degree elevation.
CubicBezier quadToCubic(const QuadBezier&);

Vec2f eval(const QuadBezier&, float t);
Vec2f eval(const CubicBezier&, float t);
Vec2f eval(const CenterArc&, float angle);

/// Splits the curve at t = 0.5 (de casteljau).
std::pair<CubicBezier, CubicBezier> subdivide(const CubicBezier&);

/// Returns whether the curve deviates less than tolerance from
/// the line between its start and end point.
bool flat(const CubicBezier&, float tolerance);

/// Converts an svg endpoint arc to center parameterization.
/// See www.w3.org/TR/SVG/implnote.html#ArcImplementationNotes.
/// Radii are made absolute and scaled up if they are too small.
/// Returns nullopt for degenerate arcs: from == to (nothing to draw) or
/// a zero radius (to be drawn as line).
std::optional<CenterArc> centerArc(Vec2f from, Vec2f radii,
	float xRotation, ArcFlags, Vec2f to);

/// Approximates the arc with cubic curves, each spanning at most
/// a quarter turn. The curves are appended to the given vector.
void toCubics(const CenterArc&, std::vector<CubicBezier>&);

/// Lazily produces the polyline approximating a single curve.
/// Each next() call returns the next polyline point (the start point
/// of the curve is not returned), the last one is always exactly
/// the end point of the curve.
/// Works with an explicit subdivision stack, so no more than one
/// segment is computed per call.
class CurveFlattener {
public:
	CurveFlattener() = default;
	CurveFlattener(const CubicBezier&, const FlattenSettings&);
	CurveFlattener(const QuadBezier&, const FlattenSettings&);

	std::optional<Vec2f> next();
	bool done() const { return stack_.empty(); }

protected:
	struct Entry {
		CubicBezier curve;
		unsigned level;
	};

	std::vector<Entry> stack_;
	float tolerance_ {};
	unsigned maxLevel_ {};
};

/// Appends the polyline approximating the given curve to points.
/// The curves start point is not added.
void flatten(const CubicBezier&, const FlattenSettings&, std::vector<Vec2f>& points);
void flatten(const QuadBezier&, const FlattenSettings&, std::vector<Vec2f>& points);

} // namespace vpath
