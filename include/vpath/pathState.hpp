// Copyright (c) 2018 nyorain
// Distributed under the Boost Software License, Version 1.0.
// See accompanying file LICENSE or copy at http://www.boost.org/LICENSE_1_0.txt

#pragma once

#include <vpath/fwd.hpp>
#include <nytl/vec.hpp>
#include <optional>

namespace vpath {

/// Tracks where the pen is while a path is built.
/// Validates builder operations and resolves their relative and
/// smooth variants. Owned by a PathBuilder, there is no shared state.
///
/// There are two states: no open subpath (initially and after every
/// end/close) and an open subpath (after begin). Drawing edges
/// requires an open subpath, otherwise an InvalidStateError is thrown
/// and the state is left unchanged.
class PathState {
public:
	PathState() = default;

	/// Throws InvalidStateError naming the given operation if no
	/// subpath is open.
	void requireOpen(const char* operation) const;

	/// Starts a new subpath at the given position.
	/// An open subpath must be ended by the caller first.
	void begin(Vec2f at);

	void lineTo(Vec2f to);
	void quadraticTo(Vec2f ctrl, Vec2f to);
	void cubicTo(Vec2f ctrl1, Vec2f ctrl2, Vec2f to);

	/// Closes the open subpath, the pen returns to its start.
	void close();

	/// Ends the open subpath without closing it.
	void end();

	/// Moves the pen to the given position without opening a subpath.
	/// Used when complete subpaths were added from elsewhere.
	void reset(Vec2f position);

	/// The leading control point of a smooth curve continuing from
	/// the current position: the trailing control point mirrored on the
	/// current position or the current position if the previous
	/// command was no curve.
	Vec2f smoothCtrl() const;

	/// The position the given delta is relative to.
	Vec2f relative(Vec2f delta) const;

	bool open() const { return open_; }
	const Vec2f& current() const { return current_; }
	const Vec2f& first() const { return first_; }
	const std::optional<Vec2f>& trailing() const { return trailing_; }

protected:
	Vec2f current_ {};
	Vec2f first_ {};
	std::optional<Vec2f> trailing_ {};
	bool open_ {};
};

} // namespace vpath
