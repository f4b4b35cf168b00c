// Tests building paths: event output, subpath handling, rejected
// operations, smooth/relative variants and arcs.

#include <bugged.hpp>
#include <vpath/path.hpp>
#include <vpath/error.hpp>
#include <nytl/vecOps.hpp>
#include <nytl/math.hpp>

#include <cmath>
#include <string>
#include <vector>

using namespace vpath;

namespace {

std::vector<PathEvent> collect(const Path& path) {
	std::vector<PathEvent> ret;
	for(auto& event : path.iter()) {
		ret.push_back(event);
	}
	return ret;
}

bool near(Vec2f a, Vec2f b, float eps = 1e-3f) {
	auto d = a - b;
	return std::sqrt(dot(d, d)) <= eps;
}

} // anon namespace

TEST(simple) {
	auto builder = Path::builder();
	builder.moveTo({0.f, 0.f});
	builder.lineTo({1.f, 2.f});
	builder.lineTo({2.f, 0.f});
	builder.lineTo({1.f, 1.f});
	builder.close();
	auto path = builder.build();

	auto events = collect(path);
	EXPECT(events.size(), 5u);
	EXPECT(events[0], PathEvent(BeginEvent {{0.f, 0.f}}));
	EXPECT(events[1], PathEvent(LineEvent {{0.f, 0.f}, {1.f, 2.f}}));
	EXPECT(events[2], PathEvent(LineEvent {{1.f, 2.f}, {2.f, 0.f}}));
	EXPECT(events[3], PathEvent(LineEvent {{2.f, 0.f}, {1.f, 1.f}}));
	EXPECT(events[4], PathEvent(EndEvent {{1.f, 1.f}, {0.f, 0.f}, true}));
}

TEST(curves) {
	auto builder = Path::builder();
	builder.moveTo({0.f, 0.f});
	builder.quadraticBezierTo({1.f, 1.f}, {2.f, 0.f});
	builder.cubicBezierTo({3.f, 1.f}, {4.f, -1.f}, {5.f, 0.f});
	builder.lineTo({5.f, 5.f});
	auto path = builder.build();

	auto events = collect(path);
	EXPECT(events.size(), 5u);
	EXPECT(events[1], PathEvent(QuadraticEvent {{0.f, 0.f}, {1.f, 1.f}, {2.f, 0.f}}));
	EXPECT(events[2], PathEvent(CubicEvent {{2.f, 0.f}, {3.f, 1.f}, {4.f, -1.f}, {5.f, 0.f}}));
	EXPECT(events[3], PathEvent(LineEvent {{5.f, 0.f}, {5.f, 5.f}}));

	// unterminated subpath is ended on build
	EXPECT(events[4], PathEvent(EndEvent {{5.f, 5.f}, {0.f, 0.f}, false}));

	// edges chain
	for(auto i = 1u; i < events.size(); ++i) {
		EXPECT(from(events[i]), to(events[i - 1]));
	}
}

TEST(noSubpath) {
	auto builder = Path::builder();
	ERROR(builder.lineTo({1.f, 1.f}), InvalidStateError);
	ERROR(builder.horizontalLineTo(1.f), InvalidStateError);
	ERROR(builder.verticalLineTo(1.f), InvalidStateError);
	ERROR(builder.quadraticBezierTo({1.f, 1.f}, {2.f, 0.f}), InvalidStateError);
	ERROR(builder.cubicBezierTo({1.f, 1.f}, {2.f, 1.f}, {3.f, 0.f}), InvalidStateError);
	ERROR(builder.smoothQuadraticBezierTo({1.f, 1.f}), InvalidStateError);
	ERROR(builder.smoothCubicBezierTo({1.f, 1.f}, {2.f, 0.f}), InvalidStateError);
	ERROR(builder.arcTo({1.f, 1.f}, 0.f, {}, {2.f, 0.f}), InvalidStateError);
	ERROR(builder.relativeLineTo({1.f, 1.f}), InvalidStateError);
	ERROR(builder.relativeArcTo({1.f, 1.f}, 0.f, {}, {2.f, 0.f}), InvalidStateError);

	auto path = builder.build();
	EXPECT(path.empty(), true);
	EXPECT(path.points().size(), 0u);
	EXPECT(path.iter().next().has_value(), false);
}

TEST(afterClose) {
	auto builder = Path::builder();
	builder.moveTo({0.f, 0.f});
	builder.lineTo({1.f, 0.f});
	builder.close();

	ERROR(builder.lineTo({1.f, 1.f}), InvalidStateError);
	ERROR(builder.cubicBezierTo({1.f, 1.f}, {2.f, 1.f}, {3.f, 0.f}), InvalidStateError);
	ERROR(builder.arcTo({1.f, 1.f}, 0.f, {}, {2.f, 0.f}), InvalidStateError);

	// closing again is harmless
	builder.close();

	auto path = builder.build();
	auto events = collect(path);
	EXPECT(events.size(), 3u);
	EXPECT(events[2], PathEvent(EndEvent {{1.f, 0.f}, {0.f, 0.f}, true}));
	EXPECT(path.points().size(), 2u);

	// the operation name is reported
	auto b2 = Path::builder();
	auto caught = false;
	try {
		b2.cubicBezierTo({1.f, 1.f}, {2.f, 1.f}, {3.f, 0.f});
	} catch(const InvalidStateError& err) {
		caught = true;
		EXPECT(err.operation(), std::string("cubicBezierTo"));
	}
	EXPECT(caught, true);
}

TEST(recover) {
	auto builder = Path::builder();
	ERROR(builder.lineTo({1.f, 1.f}), InvalidStateError);
	builder.moveTo({0.f, 0.f});
	builder.lineTo({1.f, 1.f});

	auto events = collect(builder.build());
	EXPECT(events.size(), 3u);
	EXPECT(events[1], PathEvent(LineEvent {{0.f, 0.f}, {1.f, 1.f}}));
}

TEST(closeWithoutSubpath) {
	auto builder = Path::builder();
	builder.close();
	EXPECT(builder.build().empty(), true);
}

TEST(moveWhileOpen) {
	auto builder = Path::builder();
	builder.moveTo({0.f, 0.f});
	builder.lineTo({1.f, 0.f});
	builder.moveTo({5.f, 5.f});
	builder.lineTo({6.f, 5.f});
	auto path = builder.build();

	auto events = collect(path);
	EXPECT(events.size(), 6u);
	EXPECT(events[2], PathEvent(EndEvent {{1.f, 0.f}, {0.f, 0.f}, false}));
	EXPECT(events[3], PathEvent(BeginEvent {{5.f, 5.f}}));
	EXPECT(events[5], PathEvent(EndEvent {{6.f, 5.f}, {5.f, 5.f}, false}));
	EXPECT(path.subpathCount(), 2u);
}

TEST(emptySubpath) {
	auto builder = Path::builder();
	builder.moveTo({3.f, 3.f});
	builder.close();
	auto events = collect(builder.build());
	EXPECT(events.size(), 2u);
	EXPECT(events[1], PathEvent(EndEvent {{3.f, 3.f}, {3.f, 3.f}, true}));
}

TEST(smoothQuadratic) {
	auto builder = Path::builder();
	builder.moveTo({0.f, 0.f});
	builder.quadraticBezierTo({1.f, 2.f}, {2.f, 0.f});
	builder.smoothQuadraticBezierTo({4.f, 0.f});

	// smooth after smooth: reflects the implied control point
	builder.smoothQuadraticBezierTo({6.f, 0.f});

	// no previous curve: control point is the current position
	builder.lineTo({7.f, 0.f});
	builder.smoothQuadraticBezierTo({8.f, 1.f});

	auto events = collect(builder.build());
	EXPECT(events[2], PathEvent(QuadraticEvent {{2.f, 0.f}, {3.f, -2.f}, {4.f, 0.f}}));
	EXPECT(events[3], PathEvent(QuadraticEvent {{4.f, 0.f}, {5.f, 2.f}, {6.f, 0.f}}));
	EXPECT(events[5], PathEvent(QuadraticEvent {{7.f, 0.f}, {7.f, 0.f}, {8.f, 1.f}}));
}

TEST(smoothCubic) {
	auto builder = Path::builder();
	builder.moveTo({0.f, 0.f});
	builder.smoothCubicBezierTo({2.f, 1.f}, {3.f, 0.f});
	builder.smoothCubicBezierTo({5.f, -2.f}, {6.f, 0.f});

	auto events = collect(builder.build());
	EXPECT(events[1], PathEvent(CubicEvent {{0.f, 0.f}, {0.f, 0.f}, {2.f, 1.f}, {3.f, 0.f}}));
	EXPECT(events[2], PathEvent(CubicEvent {{3.f, 0.f}, {4.f, -1.f}, {5.f, -2.f}, {6.f, 0.f}}));
}

TEST(relative) {
	auto builder = Path::builder();
	builder.relativeMoveTo({2.f, 3.f});
	builder.relativeLineTo({1.f, 0.f});
	builder.relativeQuadraticBezierTo({1.f, 1.f}, {2.f, 0.f});
	builder.relativeCubicBezierTo({0.f, 1.f}, {1.f, 1.f}, {1.f, 0.f});
	builder.horizontalLineTo(10.f);
	builder.verticalLineTo(0.f);
	EXPECT(builder.currentPosition(), (Vec2f{10.f, 0.f}));
	builder.close();

	// relative to the start of the closed subpath
	builder.relativeMoveTo({1.f, 1.f});
	EXPECT(builder.currentPosition(), (Vec2f{3.f, 4.f}));

	auto events = collect(builder.build());
	EXPECT(events[0], PathEvent(BeginEvent {{2.f, 3.f}}));
	EXPECT(events[1], PathEvent(LineEvent {{2.f, 3.f}, {3.f, 3.f}}));
	EXPECT(events[2], PathEvent(QuadraticEvent {{3.f, 3.f}, {4.f, 4.f}, {5.f, 3.f}}));
	EXPECT(events[3], PathEvent(CubicEvent {{5.f, 3.f}, {5.f, 4.f}, {6.f, 4.f}, {6.f, 3.f}}));
	EXPECT(events[4], PathEvent(LineEvent {{6.f, 3.f}, {10.f, 3.f}}));
	EXPECT(events[5], PathEvent(LineEvent {{10.f, 3.f}, {10.f, 0.f}}));
	EXPECT(events[6], PathEvent(EndEvent {{10.f, 0.f}, {2.f, 3.f}, true}));
	EXPECT(events[7], PathEvent(BeginEvent {{3.f, 4.f}}));
}

TEST(quarterArc) {
	auto builder = Path::builder();
	builder.moveTo({1.f, 0.f});
	builder.arcTo({1.f, 1.f}, 0.f, {false, true}, {0.f, 1.f});
	auto events = collect(builder.build());

	EXPECT(events.size(), 3u);
	auto* cubic = std::get_if<CubicEvent>(&events[1]);
	EXPECT(cubic != nullptr, true);
	EXPECT(cubic->from, (Vec2f{1.f, 0.f}));
	EXPECT(cubic->to, (Vec2f{0.f, 1.f}));

	auto bezier = CubicBezier {cubic->from, cubic->ctrl1, cubic->ctrl2, cubic->to};
	auto s = std::sqrt(0.5f);
	EXPECT(near(eval(bezier, 0.5f), {s, s}), true);
}

TEST(negativeSweepArc) {
	// other side: center is (1, 1)
	auto builder = Path::builder();
	builder.moveTo({1.f, 0.f});
	builder.arcTo({1.f, 1.f}, 0.f, {false, false}, {0.f, 1.f});
	auto events = collect(builder.build());

	EXPECT(events.size(), 3u);
	auto& cubic = std::get<CubicEvent>(events[1]);
	auto bezier = CubicBezier {cubic.from, cubic.ctrl1, cubic.ctrl2, cubic.to};
	auto s = 1.f - std::sqrt(0.5f);
	EXPECT(near(eval(bezier, 0.5f), {s, s}), true);
}

TEST(largeArc) {
	auto builder = Path::builder();
	builder.moveTo({1.f, 0.f});
	builder.arcTo({1.f, 1.f}, 0.f, {true, true}, {0.f, -1.f});
	builder.close();
	auto events = collect(builder.build());

	// three quarter turns, one cubic each
	EXPECT(events.size(), 5u);
	for(auto i = 1u; i < 4u; ++i) {
		auto& c = std::get<CubicEvent>(events[i]);
		auto bezier = CubicBezier {c.from, c.ctrl1, c.ctrl2, c.to};
		for(auto t : {0.f, 0.25f, 0.5f, 0.75f, 1.f}) {
			auto p = eval(bezier, t);
			EXPECT(std::abs(std::sqrt(dot(p, p)) - 1.f) < 1e-3f, true);
		}
	}

	EXPECT(near(std::get<CubicEvent>(events[1]).to, {0.f, 1.f}), true);
	EXPECT(near(std::get<CubicEvent>(events[2]).to, {-1.f, 0.f}), true);
	EXPECT(std::get<CubicEvent>(events[3]).to, (Vec2f{0.f, -1.f}));
}

TEST(rotatedArc) {
	// radii too small get scaled up: half ellipse through both points
	auto builder = Path::builder();
	builder.moveTo({0.f, 0.f});
	builder.arcTo({1.f, 0.5f}, 0.5f * float(nytl::constants::pi), {false, true},
		{0.f, 4.f});
	auto events = collect(builder.build());

	EXPECT(events.size(), 4u);
	EXPECT(std::get<CubicEvent>(events[2]).to, (Vec2f{0.f, 4.f}));

	// rotated by 90 degrees the x radius (scaled to 2) points along y,
	// the y radius (scaled to 1) along x
	auto& c = std::get<CubicEvent>(events[1]);
	EXPECT(near(c.to, {-1.f, 2.f}) || near(c.to, {1.f, 2.f}), true);
}

TEST(degenerateArcs) {
	auto builder = Path::builder();
	builder.moveTo({1.f, 1.f});

	// same point: nothing to draw
	builder.arcTo({1.f, 1.f}, 0.f, {}, {1.f, 1.f});

	// zero radius: straight line
	builder.arcTo({0.f, 1.f}, 0.f, {}, {3.f, 1.f});
	auto events = collect(builder.build());

	EXPECT(events.size(), 3u);
	EXPECT(events[1], PathEvent(LineEvent {{1.f, 1.f}, {3.f, 1.f}}));
}

TEST(polygon) {
	std::vector<Vec2f> points = {{0.f, 0.f}, {1.f, 0.f}, {1.f, 1.f}};

	auto builder = Path::builder();
	builder.polygon(points);
	builder.polygon(points, false);
	builder.polygon({});

	auto events = collect(builder.build());
	EXPECT(events.size(), 8u);
	EXPECT(events[3], PathEvent(EndEvent {{1.f, 1.f}, {0.f, 0.f}, true}));
	EXPECT(events[4], PathEvent(BeginEvent {{0.f, 0.f}}));
	EXPECT(events[7], PathEvent(EndEvent {{1.f, 1.f}, {0.f, 0.f}, false}));
}

TEST(reuse) {
	auto builder = Path::builder();
	builder.moveTo({0.f, 0.f});
	builder.lineTo({1.f, 1.f});
	auto first = builder.build();
	EXPECT(first.empty(), false);

	// builder is empty afterwards
	EXPECT(builder.state().open(), false);
	EXPECT(builder.build().empty(), true);
	ERROR(builder.lineTo({1.f, 1.f}), InvalidStateError);

	builder.moveTo({0.f, 0.f});
	builder.lineTo({1.f, 1.f});
	EXPECT(builder.build(), first);
}
