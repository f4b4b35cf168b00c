// Copyright (c) 2018 nyorain
// Distributed under the Boost Software License, Version 1.0.
// See accompanying file LICENSE or copy at http://www.boost.org/LICENSE_1_0.txt

#include <vpath/svg.hpp>
#include <vpath/path.hpp>
#include <nytl/vecOps.hpp>
#include <nytl/math.hpp>
#include <dlg/dlg.hpp>

#include <cctype>
#include <cstdlib>
#include <cstring>
#include <string>

// https://svgwg.org/svg2-draft/paths.html#DProperty
// https://www.w3.org/TR/SVG11/paths.html#PathElement

namespace vpath {
namespace {

class SvgParser {
public:
	SvgParser(std::string_view svg, PathBuilder& builder) :
		data_(svg), it_(data_.c_str()), builder_(builder) {}

	void parse() {
		auto last = '\0';
		while(skip()) {
			auto c = *it_;
			if(std::isalpha(static_cast<unsigned char>(c))) {
				++it_;
			} else if(last != '\0' && last != 'Z' && last != 'z') {
				// repeated coordinates, subsequent move pairs are lines
				c = (last == 'M') ? 'L' : (last == 'm') ? 'l' : last;
			} else {
				error("Expected command");
			}

			if(last == '\0' && c != 'M' && c != 'm') {
				--it_;
				error("Path data must start with a moveto command");
			}

			command(c, last);
			last = c;
		}
	}

protected:
	void command(char c, char last) {
		auto rel = std::islower(static_cast<unsigned char>(c)) != 0;
		auto base = [&]{ return rel ? builder_.currentPosition() : Vec2f{}; };

		auto lower = char(std::tolower(static_cast<unsigned char>(c)));
		if(!std::strchr("mlhvcsqtaz", lower)) {
			--it_;
			error("Invalid command");
		}

		// svg allows drawing after 'z', starting at the closed subpath
		if(lower != 'm' && lower != 'z' && !builder_.state().open()) {
			builder_.moveTo(builder_.currentPosition());
		}

		switch(lower) {
			case 'm': {
				auto p = point();
				rel ? builder_.relativeMoveTo(p) : builder_.moveTo(p);
				break;
			} case 'l': {
				auto p = point();
				rel ? builder_.relativeLineTo(p) : builder_.lineTo(p);
				break;
			} case 'h': {
				builder_.horizontalLineTo(base().x + number());
				break;
			} case 'v': {
				builder_.verticalLineTo(base().y + number());
				break;
			} case 'c': {
				auto b = base();
				auto c1 = b + point();
				auto c2 = b + point();
				auto to = b + point();
				builder_.cubicBezierTo(c1, c2, to);
				break;
			} case 's': {
				auto b = base();
				auto c2 = b + point();
				auto to = b + point();
				auto prev = char(std::tolower(static_cast<unsigned char>(last)));
				if(prev == 'c' || prev == 's') {
					builder_.smoothCubicBezierTo(c2, to);
				} else {
					builder_.cubicBezierTo(builder_.currentPosition(), c2, to);
				}
				break;
			} case 'q': {
				auto b = base();
				auto ctrl = b + point();
				auto to = b + point();
				builder_.quadraticBezierTo(ctrl, to);
				break;
			} case 't': {
				auto to = base() + point();
				auto prev = char(std::tolower(static_cast<unsigned char>(last)));
				if(prev == 'q' || prev == 't') {
					builder_.smoothQuadraticBezierTo(to);
				} else {
					builder_.quadraticBezierTo(builder_.currentPosition(), to);
				}
				break;
			} case 'a': {
				auto radii = point();
				auto rotation = number() * float(nytl::constants::pi / 180);
				auto flags = ArcFlags {};
				flags.largeArc = flag();
				flags.sweep = flag();
				auto to = base() + point();
				builder_.arcTo(radii, rotation, flags, to);
				break;
			} case 'z': {
				builder_.close();
				break;
			}
		}
	}

	// Skips whitespace and commas, returns whether there is more input.
	bool skip() {
		while(*it_ && (std::isspace(static_cast<unsigned char>(*it_)) || *it_ == ',')) {
			++it_;
		}

		return *it_ != '\0';
	}

	float number() {
		if(!skip()) {
			error("Unexpected end, expected number");
		}

		char* end {};
		auto ret = std::strtof(it_, &end);
		if(end == it_) {
			error("Expected number");
		}

		it_ = end;
		return ret;
	}

	// Arc flags may be written without separator, e.g. "a1 1 0 00 1 1".
	bool flag() {
		if(!skip() || (*it_ != '0' && *it_ != '1')) {
			error("Expected arc flag");
		}

		return *(it_++) == '1';
	}

	Vec2f point() {
		auto x = number();
		auto y = number();
		return {x, y};
	}

	[[noreturn]] void error(const char* msg) {
		auto pos = std::size_t(it_ - data_.c_str());
		dlg_warn("parseSvg: {} at {}", msg, pos);
		throw ParseError(msg, pos);
	}

protected:
	std::string data_; // null-terminated for strtof
	const char* it_;
	PathBuilder& builder_;
};

} // anon namespace

ParseError::ParseError(const std::string& msg, std::size_t position) :
	std::runtime_error("vpath::parseSvg: " + msg + " at " +
		std::to_string(position)),
	position_(position) {
}

void parseSvg(std::string_view svg, PathBuilder& builder) {
	SvgParser(svg, builder).parse();
}

Path parseSvg(std::string_view svg) {
	auto builder = Path::builder();
	parseSvg(svg, builder);
	return builder.build();
}

} // namespace vpath
