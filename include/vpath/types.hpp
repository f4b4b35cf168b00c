// Copyright (c) 2018 nyorain
// Distributed under the Boost Software License, Version 1.0.
// See accompanying file LICENSE or copy at http://www.boost.org/LICENSE_1_0.txt

#pragma once

#include <vpath/fwd.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <iosfwd>
#include <limits>

namespace vpath {

/// Defines how to determine what is inside and what is outside
/// of a shape. See the SVG fill-rule property.
/// Only consumed by fill/tessellation code, paths don't interpret it.
enum class FillRule {
	evenOdd,
	nonZero
};

/// A virtual vertex offset in a geometry.
/// Only valid between the begin and end of a geometry of some
/// external geometry builder, which usually translates ids so that the
/// first id in a geometry is zero. Paths never create or interpret them.
struct VertexId {
	static constexpr Index invalidValue = std::numeric_limits<Index>::max();
	static const VertexId invalid;

	Index value {invalidValue};

	VertexId() = default;
	constexpr explicit VertexId(Index v) : value(v) {}
	constexpr explicit VertexId(std::uint16_t v) : value(v) {}
	constexpr explicit VertexId(std::int32_t v) : value(static_cast<Index>(v)) {}

	static VertexId fromUsize(std::size_t v) { return VertexId(static_cast<Index>(v)); }

	constexpr Index offset() const { return value; }
	constexpr std::size_t toUsize() const { return value; }
	constexpr bool valid() const { return value != invalidValue; }

	// Narrowing conversions truncate.
	constexpr explicit operator std::uint16_t() const { return static_cast<std::uint16_t>(value); }
	constexpr explicit operator std::uint32_t() const { return value; }
	constexpr explicit operator std::int32_t() const { return static_cast<std::int32_t>(value); }
	constexpr explicit operator std::size_t() const { return value; }
};

inline constexpr VertexId VertexId::invalid = VertexId(VertexId::invalidValue);

/// Offsetting must stay within [0, invalid). Checked with dlg_assert.
VertexId operator+(VertexId id, Index offset);
VertexId operator-(VertexId id, Index offset);
VertexId& operator+=(VertexId& id, Index offset);
VertexId& operator-=(VertexId& id, Index offset);

constexpr bool operator==(VertexId a, VertexId b) { return a.value == b.value; }
constexpr bool operator!=(VertexId a, VertexId b) { return a.value != b.value; }
constexpr bool operator<(VertexId a, VertexId b) { return a.value < b.value; }

std::ostream& operator<<(std::ostream&, VertexId);
std::ostream& operator<<(std::ostream&, FillRule);

} // namespace vpath

namespace std {

template<>
struct hash<vpath::VertexId> {
	std::size_t operator()(vpath::VertexId id) const noexcept {
		return std::hash<vpath::Index>{}(id.value);
	}
};

} // namespace std
