// Copyright (c) 2018 nyorain
// Distributed under the Boost Software License, Version 1.0.
// See accompanying file LICENSE or copy at http://www.boost.org/LICENSE_1_0.txt

#pragma once

#include <vpath/fwd.hpp>
#include <nytl/vec.hpp>

#include <cstdint>
#include <iosfwd>
#include <variant>

namespace vpath {

/// Tags the kind of segment stored at a position of a paths verb buffer.
/// Number of points each verb consumes from the point buffer:
/// begin: 1 (at), line: 1 (to), quadratic: 2 (ctrl, to),
/// cubic: 3 (ctrl1, ctrl2, to), close: 0, end: 0.
enum class Verb : std::uint8_t {
	begin,
	line,
	quadratic,
	cubic,
	close,
	end
};

/// Returns how many points the given verb consumes.
constexpr unsigned pointCount(Verb verb) {
	switch(verb) {
		case Verb::begin: return 1u;
		case Verb::line: return 1u;
		case Verb::quadratic: return 2u;
		case Verb::cubic: return 3u;
		default: return 0u;
	}
}

/// Starts a new subpath.
struct BeginEvent {
	Vec2f at;
};

struct LineEvent {
	Vec2f from;
	Vec2f to;
};

struct QuadraticEvent {
	Vec2f from;
	Vec2f ctrl;
	Vec2f to;
};

struct CubicEvent {
	Vec2f from;
	Vec2f ctrl1;
	Vec2f ctrl2;
	Vec2f to;
};

/// Ends the current subpath.
/// If close is set, consumers must honor the implicit closing edge
/// from last back to first.
struct EndEvent {
	Vec2f last;
	Vec2f first;
	bool close {};
};

/// The atomic unit of a path description.
/// Every subpath is described by exactly one BeginEvent, followed by
/// any number of edge events and exactly one EndEvent. Edges chain,
/// i.e. the 'from' point of an edge is the 'to' point of the previous
/// edge or the 'at' point of the BeginEvent.
using PathEvent = std::variant<
	BeginEvent,
	LineEvent,
	QuadraticEvent,
	CubicEvent,
	EndEvent>;

/// Whether the event is a line or curve.
bool isEdge(const PathEvent&);

/// Start point of the event. For BeginEvent that is 'at', for
/// EndEvent 'last'.
Vec2f from(const PathEvent&);

/// End point of the event. For BeginEvent that is 'at', for
/// EndEvent 'first'.
Vec2f to(const PathEvent&);

bool operator==(const BeginEvent&, const BeginEvent&);
bool operator==(const LineEvent&, const LineEvent&);
bool operator==(const QuadraticEvent&, const QuadraticEvent&);
bool operator==(const CubicEvent&, const CubicEvent&);
bool operator==(const EndEvent&, const EndEvent&);

inline bool operator!=(const BeginEvent& a, const BeginEvent& b) { return !(a == b); }
inline bool operator!=(const LineEvent& a, const LineEvent& b) { return !(a == b); }
inline bool operator!=(const QuadraticEvent& a, const QuadraticEvent& b) { return !(a == b); }
inline bool operator!=(const CubicEvent& a, const CubicEvent& b) { return !(a == b); }
inline bool operator!=(const EndEvent& a, const EndEvent& b) { return !(a == b); }

std::ostream& operator<<(std::ostream&, Verb);
std::ostream& operator<<(std::ostream&, const BeginEvent&);
std::ostream& operator<<(std::ostream&, const LineEvent&);
std::ostream& operator<<(std::ostream&, const QuadraticEvent&);
std::ostream& operator<<(std::ostream&, const CubicEvent&);
std::ostream& operator<<(std::ostream&, const EndEvent&);
std::ostream& operator<<(std::ostream&, const PathEvent&);

} // namespace vpath
