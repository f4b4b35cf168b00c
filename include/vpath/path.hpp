// Copyright (c) 2018 nyorain
// Distributed under the Boost Software License, Version 1.0.
// See accompanying file LICENSE or copy at http://www.boost.org/LICENSE_1_0.txt

#pragma once

#include <vpath/fwd.hpp>
#include <vpath/event.hpp>
#include <vpath/curves.hpp>
#include <vpath/iterator.hpp>
#include <vpath/pathState.hpp>

#include <nytl/vec.hpp>
#include <nytl/span.hpp>

#include <cstddef>
#include <iosfwd>
#include <vector>

namespace vpath {

/// Immutable path, made up of any number of subpaths.
/// Stores a buffer of verbs and a buffer of the points they consume
/// (see Verb), no per-subpath allocation is done.
/// Only a PathBuilder can create non-empty paths. Once built, a path
/// can be read by any number of iterators at the same time.
///
/// ```cpp
/// auto builder = vpath::Path::builder();
/// builder.moveTo({0.f, 0.f});
/// builder.lineTo({1.f, 2.f});
/// builder.lineTo({2.f, 0.f});
/// builder.close();
///
/// auto path = builder.build();
/// for(auto& event : path.iter()) {
/// 	dlg_info("{}", event);
/// }
/// ```
class Path {
public:
	static PathBuilder builder();

public:
	Path() = default;

	/// Returns an iterator over the events of this path.
	EventIterator iter() const;

	/// Returns an iterator over the events of this path with all curves
	/// approximated by lines.
	/// Throws std::invalid_argument if the tolerance is not positive.
	FlatteningIterator flattened(float tolerance) const;
	FlatteningIterator flattened(const FlattenSettings&) const;

	/// Returns the ith point of the point buffer.
	/// Throws std::out_of_range if there is no such point.
	const Vec2f& point(std::size_t i) const;

	nytl::Span<const Vec2f> points() const { return {points_.data(), points_.size()}; }
	nytl::Span<const Verb> verbs() const { return {verbs_.data(), verbs_.size()}; }

	bool empty() const { return verbs_.empty(); }
	std::size_t subpathCount() const;

	/// Returns a path in which every subpath is traversed backwards.
	/// The order of subpaths and whether they are closed is kept.
	Path reversed() const;

	bool operator==(const Path& rhs) const;
	bool operator!=(const Path& rhs) const { return !(*this == rhs); }

protected:
	friend class PathBuilder;
	friend class EventIterator;

	std::vector<Verb> verbs_;
	std::vector<Vec2f> points_;
};

/// Builds a path from drawing commands.
/// Edges can only be drawn while a subpath is open, i.e. after moveTo
/// and before close. Invalid calls throw InvalidStateError and leave
/// the builder as it was, so callers may recover by calling moveTo.
class PathBuilder {
public:
	PathBuilder() = default;

	/// Starts a new subpath. Ends the current one without closing
	/// it if there is one.
	void moveTo(Vec2f to);

	void lineTo(Vec2f to);
	void horizontalLineTo(float x);
	void verticalLineTo(float y);
	void quadraticBezierTo(Vec2f ctrl, Vec2f to);
	void cubicBezierTo(Vec2f ctrl1, Vec2f ctrl2, Vec2f to);

	/// Curves whose first control point is the last control point
	/// of the previous curve mirrored on the current position.
	/// If the previous command was no curve, the current position
	/// is used as control point.
	void smoothQuadraticBezierTo(Vec2f to);
	void smoothCubicBezierTo(Vec2f ctrl2, Vec2f to);

	/// Svg-style elliptical arc from the current position to 'to'.
	/// Stored as cubic curves. If 'to' is the current position, nothing
	/// is added. If one of the radii is zero, a line is added.
	void arcTo(Vec2f radii, float xRotation, ArcFlags flags, Vec2f to);

	// Same as above, but all points are relative to the current position.
	void relativeMoveTo(Vec2f to);
	void relativeLineTo(Vec2f to);
	void relativeQuadraticBezierTo(Vec2f ctrl, Vec2f to);
	void relativeCubicBezierTo(Vec2f ctrl1, Vec2f ctrl2, Vec2f to);
	void relativeArcTo(Vec2f radii, float xRotation, ArcFlags flags, Vec2f to);

	/// Closes the current subpath.
	/// Does nothing if there is no open subpath.
	void close();

	/// Adds a subpath through all the given points.
	void polygon(nytl::Span<const Vec2f> points, bool closed = true);

	/// Adds all subpaths of the given path. Ends the current subpath
	/// without closing it if there is one.
	void append(const Path& path);

	void reserve(std::size_t verbs, std::size_t points);

	/// Finishes the path. Ends the current subpath without closing it
	/// if there is one. The builder is empty afterwards and can be
	/// used to build another path.
	Path build();

	Vec2f currentPosition() const { return state_.current(); }
	const PathState& state() const { return state_; }

protected:
	void end();
	void cubic(Vec2f ctrl1, Vec2f ctrl2, Vec2f to);
	void arc(const char* op, Vec2f radii, float xRotation, ArcFlags, Vec2f to);

protected:
	Path path_;
	PathState state_;
};

std::ostream& operator<<(std::ostream&, const Path&);

} // namespace vpath
