// Copyright (c) 2018 nyorain
// Distributed under the Boost Software License, Version 1.0.
// See accompanying file LICENSE or copy at http://www.boost.org/LICENSE_1_0.txt

#include <vpath/event.hpp>
#include <nytl/vecOps.hpp>
#include <ostream>
#include <type_traits>

namespace vpath {

bool isEdge(const PathEvent& event) {
	return !std::holds_alternative<BeginEvent>(event) &&
		!std::holds_alternative<EndEvent>(event);
}

Vec2f from(const PathEvent& event) {
	return std::visit([](auto& e) -> Vec2f {
		using T = std::decay_t<decltype(e)>;
		if constexpr(std::is_same_v<T, BeginEvent>) {
			return e.at;
		} else if constexpr(std::is_same_v<T, EndEvent>) {
			return e.last;
		} else {
			return e.from;
		}
	}, event);
}

Vec2f to(const PathEvent& event) {
	return std::visit([](auto& e) -> Vec2f {
		using T = std::decay_t<decltype(e)>;
		if constexpr(std::is_same_v<T, BeginEvent>) {
			return e.at;
		} else if constexpr(std::is_same_v<T, EndEvent>) {
			return e.first;
		} else {
			return e.to;
		}
	}, event);
}

bool operator==(const BeginEvent& a, const BeginEvent& b) {
	return a.at == b.at;
}

bool operator==(const LineEvent& a, const LineEvent& b) {
	return a.from == b.from && a.to == b.to;
}

bool operator==(const QuadraticEvent& a, const QuadraticEvent& b) {
	return a.from == b.from && a.ctrl == b.ctrl && a.to == b.to;
}

bool operator==(const CubicEvent& a, const CubicEvent& b) {
	return a.from == b.from && a.ctrl1 == b.ctrl1 &&
		a.ctrl2 == b.ctrl2 && a.to == b.to;
}

bool operator==(const EndEvent& a, const EndEvent& b) {
	return a.last == b.last && a.first == b.first && a.close == b.close;
}

std::ostream& operator<<(std::ostream& os, Verb verb) {
	switch(verb) {
		case Verb::begin: return os << "begin";
		case Verb::line: return os << "line";
		case Verb::quadratic: return os << "quadratic";
		case Verb::cubic: return os << "cubic";
		case Verb::close: return os << "close";
		case Verb::end: return os << "end";
	}

	return os << "Verb(" << int(verb) << ")";
}

std::ostream& operator<<(std::ostream& os, const BeginEvent& e) {
	return os << "Begin{at: " << e.at << "}";
}

std::ostream& operator<<(std::ostream& os, const LineEvent& e) {
	return os << "Line{" << e.from << " -> " << e.to << "}";
}

std::ostream& operator<<(std::ostream& os, const QuadraticEvent& e) {
	return os << "Quadratic{" << e.from << " -> " << e.to
		<< ", ctrl: " << e.ctrl << "}";
}

std::ostream& operator<<(std::ostream& os, const CubicEvent& e) {
	return os << "Cubic{" << e.from << " -> " << e.to
		<< ", ctrl1: " << e.ctrl1 << ", ctrl2: " << e.ctrl2 << "}";
}

std::ostream& operator<<(std::ostream& os, const EndEvent& e) {
	return os << "End{last: " << e.last << ", first: " << e.first
		<< ", close: " << std::boolalpha << e.close << "}";
}

std::ostream& operator<<(std::ostream& os, const PathEvent& event) {
	std::visit([&](auto& e) { os << e; }, event);
	return os;
}

} // namespace vpath
