// Copyright (c) 2018 nyorain
// Distributed under the Boost Software License, Version 1.0.
// See accompanying file LICENSE or copy at http://www.boost.org/LICENSE_1_0.txt

#include <vpath/types.hpp>
#include <dlg/dlg.hpp>
#include <ostream>

namespace vpath {

VertexId operator+(VertexId id, Index offset) {
	dlg_assertm(offset < VertexId::invalidValue - id.value,
		"VertexId {} + {} overflows", id.value, offset);
	return VertexId(Index(id.value + offset));
}

VertexId operator-(VertexId id, Index offset) {
	dlg_assertm(offset <= id.value, "VertexId {} - {} underflows",
		id.value, offset);
	return VertexId(Index(id.value - offset));
}

VertexId& operator+=(VertexId& id, Index offset) {
	return id = id + offset;
}

VertexId& operator-=(VertexId& id, Index offset) {
	return id = id - offset;
}

std::ostream& operator<<(std::ostream& os, VertexId id) {
	if(!id.valid()) {
		return os << "VertexId(invalid)";
	}

	return os << "VertexId(" << id.value << ")";
}

std::ostream& operator<<(std::ostream& os, FillRule rule) {
	switch(rule) {
		case FillRule::evenOdd: return os << "evenOdd";
		case FillRule::nonZero: return os << "nonZero";
	}

	return os << "FillRule(" << int(rule) << ")";
}

} // namespace vpath
