// Copyright (c) 2018 nyorain
// Distributed under the Boost Software License, Version 1.0.
// See accompanying file LICENSE or copy at http://www.boost.org/LICENSE_1_0.txt

#pragma once

#include <vpath/fwd.hpp>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>

namespace vpath {

/// Thrown for malformed svg path data.
class ParseError : public std::runtime_error {
public:
	ParseError(const std::string& msg, std::size_t position);

	/// Offset of the offending character in the parsed string.
	std::size_t position() const { return position_; }

protected:
	std::size_t position_;
};

/// Parses svg path data (the 'd' attribute of a path element), see
/// https://www.w3.org/TR/SVG11/paths.html#PathData.
/// All commands are supported, including repeated coordinates
/// and arcs. Throws ParseError on invalid input, the builder
/// may contain the successfully parsed part then.
void parseSvg(std::string_view svg, PathBuilder& builder);
Path parseSvg(std::string_view svg);

} // namespace vpath
