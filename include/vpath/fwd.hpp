// Copyright (c) 2018 nyorain
// Distributed under the Boost Software License, Version 1.0.
// See accompanying file LICENSE or copy at http://www.boost.org/LICENSE_1_0.txt

#pragma once

#include <nytl/fwd.hpp>
#include <cstdint>

namespace vpath {

using namespace nytl;
using Index = std::uint32_t;

struct VertexId;
enum class FillRule;
enum class Verb : std::uint8_t;

struct BeginEvent;
struct LineEvent;
struct QuadraticEvent;
struct CubicEvent;
struct EndEvent;

struct QuadBezier;
struct CubicBezier;
struct CenterArc;
struct ArcFlags;
struct FlattenSettings;

class CurveFlattener;
class PathState;
class PathBuilder;
class Path;
class EventIterator;
class FlatteningIterator;

class InvalidStateError;

} // namespace vpath
