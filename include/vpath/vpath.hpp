// Copyright (c) 2018 nyorain
// Distributed under the Boost Software License, Version 1.0.
// See accompanying file LICENSE or copy at http://www.boost.org/LICENSE_1_0.txt

#pragma once

#include <vpath/fwd.hpp>
#include <vpath/types.hpp>
#include <vpath/error.hpp>
#include <vpath/event.hpp>
#include <vpath/curves.hpp>
#include <vpath/pathState.hpp>
#include <vpath/iterator.hpp>
#include <vpath/path.hpp>
#include <vpath/svg.hpp>
