// Copyright (c) 2018 nyorain
// Distributed under the Boost Software License, Version 1.0.
// See accompanying file LICENSE or copy at http://www.boost.org/LICENSE_1_0.txt

#pragma once

#include <stdexcept>
#include <string>

namespace vpath {

/// Thrown when an edge is drawn (lineTo, curves, arcs and their
/// relative/smooth variants) while no subpath is open, i.e. before the
/// first moveTo or after close() without a new moveTo.
/// The builder is left unchanged, callers may recover with moveTo.
class InvalidStateError : public std::logic_error {
public:
	explicit InvalidStateError(std::string operation);

	/// Name of the rejected builder operation, e.g. "lineTo".
	const std::string& operation() const { return operation_; }

protected:
	std::string operation_;
};

} // namespace vpath
