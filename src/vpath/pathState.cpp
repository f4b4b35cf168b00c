// Copyright (c) 2018 nyorain
// Distributed under the Boost Software License, Version 1.0.
// See accompanying file LICENSE or copy at http://www.boost.org/LICENSE_1_0.txt

#include <vpath/pathState.hpp>
#include <vpath/curves.hpp>
#include <vpath/error.hpp>
#include <nytl/vecOps.hpp>
#include <dlg/dlg.hpp>

namespace vpath {

void PathState::requireOpen(const char* operation) const {
	if(!open_) {
		dlg_warn("{}: no open subpath", operation);
		throw InvalidStateError(operation);
	}
}

void PathState::begin(Vec2f at) {
	dlg_assertm(!open_, "PathState::begin: subpath still open");
	current_ = at;
	first_ = at;
	trailing_ = std::nullopt;
	open_ = true;
}

void PathState::lineTo(Vec2f to) {
	requireOpen("lineTo");
	current_ = to;
	trailing_ = std::nullopt;
}

void PathState::quadraticTo(Vec2f ctrl, Vec2f to) {
	requireOpen("quadraticTo");
	current_ = to;
	trailing_ = ctrl;
}

void PathState::cubicTo(Vec2f, Vec2f ctrl2, Vec2f to) {
	requireOpen("cubicTo");
	current_ = to;
	trailing_ = ctrl2;
}

void PathState::close() {
	requireOpen("close");
	current_ = first_;
	trailing_ = std::nullopt;
	open_ = false;
}

void PathState::end() {
	trailing_ = std::nullopt;
	open_ = false;
}

void PathState::reset(Vec2f position) {
	current_ = position;
	first_ = position;
	trailing_ = std::nullopt;
	open_ = false;
}

Vec2f PathState::smoothCtrl() const {
	return trailing_ ? mirror(current_, *trailing_) : current_;
}

Vec2f PathState::relative(Vec2f delta) const {
	return current_ + delta;
}

} // namespace vpath
