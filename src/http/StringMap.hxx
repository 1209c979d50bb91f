// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <map>
#include <string>
#include <string_view>

/**
 * A multi-map of header names to values.  Names are compared
 * case-insensitively (ASCII only), as required for HTTP header
 * names.
 */
class StringMap {
	struct LessIgnoreCase {
		using is_transparent = void;

		[[gnu::pure]]
		bool operator()(std::string_view a,
				std::string_view b) const noexcept;
	};

	using Map = std::multimap<std::string, std::string, LessIgnoreCase>;

	Map map;

public:
	using const_iterator = Map::const_iterator;

	StringMap() = default;

	StringMap(std::initializer_list<std::pair<std::string_view, std::string_view>> init) {
		for (const auto &[key, value] : init)
			Add(key, value);
	}

	StringMap(StringMap &&) noexcept = default;
	StringMap &operator=(StringMap &&) noexcept = default;

	const_iterator begin() const noexcept {
		return map.begin();
	}

	const_iterator end() const noexcept {
		return map.end();
	}

	void Add(std::string_view key, std::string_view value) {
		map.emplace(key, value);
	}

	/**
	 * Remove all existing values with the specified key and add
	 * the new value.
	 */
	void Set(std::string_view key, std::string_view value);

	/**
	 * @return the number of removed items
	 */
	std::size_t Remove(std::string_view key) noexcept;

	/**
	 * Look up the first value with the given key.
	 *
	 * @return the value or a default-initialized std::string_view
	 * (with data()==nullptr) if there is no such key
	 */
	[[gnu::pure]]
	std::string_view Get(std::string_view key) const noexcept;

	[[gnu::pure]]
	bool Contains(std::string_view key) const noexcept {
		return map.find(key) != map.end();
	}

	[[gnu::pure]]
	std::pair<const_iterator, const_iterator> EqualRange(std::string_view key) const noexcept {
		return map.equal_range(key);
	}

	/**
	 * Move all items from #src into this object.
	 */
	void Merge(StringMap &&src) noexcept {
		map.merge(src.map);
	}
};
