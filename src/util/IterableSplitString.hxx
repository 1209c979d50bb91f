// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <iterator>
#include <string_view>

/**
 * Split a string at a certain separator character into sub strings
 * and allow iterating over the segments.
 *
 * Two consecutive separator characters result in an empty string.
 *
 * An empty input produces no segment at all.
 */
class IterableSplitString {
	std::string_view s;
	char separator;

public:
	constexpr IterableSplitString(std::string_view _s,
				      char _separator) noexcept
		:s(_s), separator(_separator) {}

	class Iterator final {
		friend class IterableSplitString;

		std::string_view current, rest;

		char separator;

		constexpr Iterator(std::string_view _s,
				   char _separator) noexcept
			:rest(_s), separator(_separator)
		{
			Next();
		}

		constexpr Iterator(std::nullptr_t n) noexcept
			:current(n, 0), rest(n, 0), separator(0) {}

		constexpr void Next() noexcept {
			if (rest.data() == nullptr) {
				current = {nullptr, 0};
			} else {
				const auto i = rest.find(separator);
				if (i == rest.npos) {
					current = rest;
					rest = {nullptr, 0};
				} else {
					current = rest.substr(0, i);
					rest = rest.substr(i + 1);
				}
			}
		}

	public:
		using iterator_category = std::forward_iterator_tag;
		using value_type = std::string_view;
		using difference_type = std::ptrdiff_t;
		using pointer = const std::string_view *;
		using reference = const std::string_view &;

		constexpr Iterator &operator++() noexcept {
			Next();
			return *this;
		}

		constexpr bool operator==(const Iterator &other) const noexcept {
			return current.data() == other.current.data();
		}

		constexpr bool operator!=(const Iterator &other) const noexcept {
			return !(*this == other);
		}

		constexpr reference operator*() const noexcept {
			return current;
		}

		constexpr pointer operator->() const noexcept {
			return &current;
		}
	};

	using iterator = Iterator;
	using const_iterator = Iterator;

	constexpr const_iterator begin() const noexcept {
		if (s.empty())
			return end();

		return {s, separator};
	}

	constexpr const_iterator end() const noexcept {
		return {nullptr};
	}
};
