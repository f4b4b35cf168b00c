// Copyright (c) 2018 nyorain
// Distributed under the Boost Software License, Version 1.0.
// See accompanying file LICENSE or copy at http://www.boost.org/LICENSE_1_0.txt

#pragma once

#include <vpath/fwd.hpp>
#include <vpath/event.hpp>
#include <vpath/curves.hpp>

#include <cstddef>
#include <iterator>
#include <optional>

namespace vpath {

/// Makes a pull-based event source (anything with a
/// 'std::optional<PathEvent> next()' function) usable as input range.
/// Iterating the range consumes the source.
/// ```cpp
/// for(auto& event : path.iter()) {
/// 	dlg_info("{}", event);
/// }
/// ```
template<typename Source>
class PullRange {
public:
	class Cursor {
	public:
		using iterator_category = std::input_iterator_tag;
		using value_type = PathEvent;
		using difference_type = std::ptrdiff_t;
		using pointer = const PathEvent*;
		using reference = const PathEvent&;

	public:
		Cursor() = default;
		explicit Cursor(Source& src) : source_(&src), current_(src.next()) {}

		reference operator*() const { return *current_; }
		pointer operator->() const { return &*current_; }

		Cursor& operator++() {
			current_ = source_->next();
			return *this;
		}

		// all exhausted cursors are equal
		bool operator==(const Cursor& rhs) const {
			return !current_ && !rhs.current_;
		}
		bool operator!=(const Cursor& rhs) const { return !(*this == rhs); }

	protected:
		Source* source_ {};
		std::optional<PathEvent> current_ {};
	};

public:
	Cursor begin() { return Cursor(static_cast<Source&>(*this)); }
	Cursor end() { return {}; }
};

/// Replays the verb and point buffers of a path as PathEvents.
/// Holds a non-owning view of the path, so it must not outlive it.
/// Any number of iterators can read the same path concurrently.
/// Not restartable, get a new iterator from the path instead.
class EventIterator : public PullRange<EventIterator> {
public:
	EventIterator() = default;
	explicit EventIterator(const Path&);

	/// Returns the next event or nullopt if all events were produced.
	std::optional<PathEvent> next();

protected:
	const Path* path_ {};
	std::size_t verb_ {};
	std::size_t point_ {};
	Vec2f current_ {};
	Vec2f first_ {};
};

/// Wraps an event iterator and approximates all curves with lines.
/// Begin, end and line events are passed through unchanged, every
/// quadratic or cubic event is replaced by line events that deviate
/// no more than the tolerance from the curve. Those are computed lazily,
/// one per next() call.
class FlatteningIterator : public PullRange<FlatteningIterator> {
public:
	/// Throws std::invalid_argument if the tolerance is not positive.
	FlatteningIterator(EventIterator events, const FlattenSettings&);

	std::optional<PathEvent> next();
	const FlattenSettings& settings() const { return settings_; }

protected:
	EventIterator events_;
	FlattenSettings settings_;
	CurveFlattener curve_;
	Vec2f last_ {};
};

} // namespace vpath
