// Copyright (c) 2018 nyorain
// Distributed under the Boost Software License, Version 1.0.
// See accompanying file LICENSE or copy at http://www.boost.org/LICENSE_1_0.txt

#include <vpath/error.hpp>
#include <utility>

namespace vpath {

InvalidStateError::InvalidStateError(std::string operation) :
	std::logic_error("vpath: " + operation + " requires an open subpath, "
		"call moveTo first"),
	operation_(std::move(operation)) {
}

} // namespace vpath
