// Copyright (c) 2018 nyorain
// Distributed under the Boost Software License, Version 1.0.
// See accompanying file LICENSE or copy at http://www.boost.org/LICENSE_1_0.txt

// Builds a few paths and prints their events as they would be passed
// to a tessellator that only handles straight edges.

#include <vpath/path.hpp>
#include <vpath/svg.hpp>
#include <vpath/error.hpp>

// some vector utilities
#include <nytl/vecOps.hpp>
#include <nytl/math.hpp>

// logging/debugging
#include <dlg/dlg.hpp>

#include <exception>

// settings
constexpr auto tolerance = 0.25f;
constexpr auto heart = "M 10,30 A 20,20 0,0,1 50,30 A 20,20 0,0,1 90,30 "
	"Q 90,60 50,90 Q 10,60 10,30 z";

int main() {
	// - builder -
	auto builder = vpath::Path::builder();
	builder.moveTo({0.f, 0.f});
	builder.lineTo({100.f, 0.f});
	builder.quadraticBezierTo({150.f, 50.f}, {100.f, 100.f});
	builder.smoothQuadraticBezierTo({100.f, 200.f});
	builder.arcTo({50.f, 50.f}, 0.f, {false, true}, {0.f, 200.f});
	builder.close();

	// invalid calls are reported, the builder stays usable
	try {
		builder.lineTo({10.f, 10.f});
	} catch(const vpath::InvalidStateError& err) {
		dlg_info("Rejected: {}", err.what());
	}

	builder.moveTo({300.f, 300.f});
	builder.cubicBezierTo({350.f, 250.f}, {400.f, 350.f}, {450.f, 300.f});
	auto path = builder.build();

	dlg_info("{} subpaths, {} verbs, {} points", path.subpathCount(),
		path.verbs().size(), path.points().size());
	for(auto& event : path.iter()) {
		dlg_info("{}", event);
	}

	// - flattened -
	auto lines = 0u;
	for(auto& event : path.flattened(tolerance)) {
		lines += std::holds_alternative<vpath::LineEvent>(event);
	}

	dlg_info("Flattened with tolerance {}: {} lines", tolerance, lines);

	// - svg -
	try {
		auto svg = vpath::parseSvg(heart).reversed();
		for(auto& event : svg.flattened(tolerance)) {
			dlg_debug("{}", event);
		}
	} catch(const std::exception& err) {
		dlg_error("Failed to parse svg path: {}", err.what());
		return 1;
	}
}
