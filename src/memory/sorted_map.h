#ifndef MEMORY_SORTED_MAP_H
#define MEMORY_SORTED_MAP_H

#include "core.h"

namespace prov::memory
{

template<typename Key, typename Value>
struct sorted_map_entry
{
	Key key;
	Value value;

	bool operator == (sorted_map_entry const &other) const = default;
};

/// An ordered map stored as a flat vector of entries sorted by key.
/// Lookups are binary searches and range queries return contiguous slices,
/// which is what the provenance map needs for its boundary probes.
template<typename Key, typename Value>
struct sorted_map
{
	using key_type = Key;
	using value_type = Value;
	using entry_type = sorted_map_entry<Key, Value>;

private:
	bz::vector<entry_type> _entries;

	entry_type *lower_bound(Key const &key) noexcept
	{
		return std::lower_bound(
			this->_entries.data(), this->_entries.data_end(),
			key,
			[](entry_type const &entry, Key const &value) {
				return entry.key < value;
			}
		);
	}

	entry_type const *lower_bound(Key const &key) const noexcept
	{
		return std::lower_bound(
			this->_entries.data(), this->_entries.data_end(),
			key,
			[](entry_type const &entry, Key const &value) {
				return entry.key < value;
			}
		);
	}

	static bool is_strictly_increasing(bz::array_view<entry_type const> elements) noexcept
	{
		auto const end = elements.data() + elements.size();
		return std::adjacent_find(
			elements.data(), end,
			[](entry_type const &lhs, entry_type const &rhs) {
				return !(lhs.key < rhs.key);
			}
		) == end;
	}

public:
	sorted_map(void) = default;

	/// The elements must be sorted by key and must not contain duplicate keys.
	static sorted_map from_presorted_elements(bz::vector<entry_type> elements)
	{
		bz_assert(is_strictly_increasing(elements));
		sorted_map result;
		result._entries = std::move(elements);
		return result;
	}

	size_t size(void) const noexcept
	{ return this->_entries.size(); }

	bool empty(void) const noexcept
	{ return this->_entries.empty(); }

	bool not_empty(void) const noexcept
	{ return this->_entries.not_empty(); }

	auto begin(void) const noexcept
	{ return this->_entries.begin(); }

	auto end(void) const noexcept
	{ return this->_entries.end(); }

	Value const *get_ptr(Key const &key) const noexcept
	{
		auto const it = this->lower_bound(key);
		if (it != this->_entries.data_end() && it->key == key)
		{
			return &it->value;
		}
		else
		{
			return nullptr;
		}
	}

	bz::optional<Value> get(Key const &key) const
	{
		auto const value = this->get_ptr(key);
		if (value != nullptr)
		{
			return *value;
		}
		else
		{
			return {};
		}
	}

	/// Returns the entries with keys in [begin, end).
	bz::array_view<entry_type const> range(Key const &begin, Key const &end) const noexcept
	{
		if (!(begin < end))
		{
			return {};
		}

		auto const first = this->lower_bound(begin);
		auto const last = std::lower_bound(
			first, this->_entries.data_end(),
			end,
			[](entry_type const &entry, Key const &value) {
				return entry.key < value;
			}
		);
		return bz::array_view<entry_type const>(first, last);
	}

	/// Removes the entries with keys in [begin, end).
	void remove_range(Key const &begin, Key const &end)
	{
		if (!(begin < end))
		{
			return;
		}

		auto const first = this->lower_bound(begin);
		auto const last = std::lower_bound(
			first, this->_entries.data_end(),
			end,
			[](entry_type const &entry, Key const &value) {
				return entry.key < value;
			}
		);
		auto const removed_count = static_cast<size_t>(last - first);
		if (removed_count == 0)
		{
			return;
		}

		std::move(last, this->_entries.data_end(), first);
		this->_entries.resize(this->_entries.size() - removed_count);
	}

	void insert(Key key, Value value)
	{
		auto const it = this->lower_bound(key);
		if (it != this->_entries.data_end() && it->key == key)
		{
			it->value = std::move(value);
			return;
		}

		auto const index = static_cast<size_t>(it - this->_entries.data());
		this->_entries.push_back(entry_type{ std::move(key), std::move(value) });
		std::rotate(
			this->_entries.data() + index,
			this->_entries.data_end() - 1,
			this->_entries.data_end()
		);
	}

	/// Inserts a block of entries in one pass.
	/// The elements must be strictly increasing by key and none of their keys may
	/// already be present in the map.  This is only checked in debug builds.
	void insert_presorted(bz::array_view<entry_type const> elements)
	{
		if (elements.empty())
		{
			return;
		}

		bz_assert(is_strictly_increasing(elements));

		if (this->_entries.empty() || this->_entries.back().key < elements.front().key)
		{
			// everything goes to the end
			this->_entries.reserve(this->_entries.size() + elements.size());
			for (auto const &entry : elements)
			{
				this->_entries.push_back(entry);
			}
			return;
		}

		bz::vector<entry_type> merged;
		merged.reserve(this->_entries.size() + elements.size());

		auto existing_it = this->_entries.data();
		auto const existing_end = this->_entries.data_end();
		auto new_it = elements.data();
		auto const new_end = elements.data() + elements.size();
		while (existing_it != existing_end && new_it != new_end)
		{
			bz_assert(existing_it->key != new_it->key);
			if (new_it->key < existing_it->key)
			{
				merged.push_back(*new_it);
				++new_it;
			}
			else
			{
				merged.push_back(std::move(*existing_it));
				++existing_it;
			}
		}
		for (; existing_it != existing_end; ++existing_it)
		{
			merged.push_back(std::move(*existing_it));
		}
		for (; new_it != new_end; ++new_it)
		{
			merged.push_back(*new_it);
		}

		this->_entries = std::move(merged);
	}

	bz::vector<Value> values(void) const
	{
		bz::vector<Value> result;
		result.reserve(this->_entries.size());
		for (auto const &entry : this->_entries)
		{
			result.push_back(entry.value);
		}
		return result;
	}

	bz::array_view<entry_type const> as_array_view(void) const noexcept
	{ return this->_entries.as_array_view(); }

	bool operator == (sorted_map const &other) const
	{ return this->_entries == other._entries; }
};

} // namespace prov::memory

#endif // MEMORY_SORTED_MAP_H
