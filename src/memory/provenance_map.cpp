#include "provenance_map.h"
#include "overflow_operations.h"
#include "global_data.h"

namespace prov::memory
{

template<typename Prov>
bz::array_view<provenance_entry<Prov> const> provenance_map<Prov>::range_get_ptrs(
	alloc_range range,
	llvm::DataLayout const &data_layout
) const
{
	// we need to go back pointer_size - 1 bytes, as a pointer starting there would
	// still overlap with the beginning of the range.  for an empty range this gives
	// the pointer that crosses the edge between `range.start - 1` and `range.start`.
	auto const pointer_size = get_pointer_size(data_layout);
	auto const adjusted_start = sub_saturating(range.start, pointer_size - 1);
	return this->_ptrs.range(adjusted_start, range.end());
}

template<typename Prov>
bz::array_view<provenance_entry<Prov> const> provenance_map<Prov>::range_get_bytes(alloc_range range) const
{
	return this->_bytes.range(range.start, range.end());
}

template<typename Prov>
provenance_map<Prov> provenance_map<Prov>::from_presorted_ptrs(bz::vector<entry_type> ptrs)
{
	provenance_map result;
	result._ptrs = sorted_map<uint64_t, Prov>::from_presorted_elements(std::move(ptrs));
	return result;
}

template<typename Prov>
sorted_map<uint64_t, Prov> const &provenance_map<Prov>::ptrs(void) const
{
	bz_assert(this->_bytes.empty());
	return this->_ptrs;
}

template<typename Prov>
bz::optional<Prov> provenance_map<Prov>::get(uint64_t offset, llvm::DataLayout const &data_layout) const
{
	auto const ptrs = this->range_get_ptrs(alloc_range{ .start = offset, .size = 1 }, data_layout);
	bz_assert(ptrs.size() <= 1);
	if (!ptrs.empty())
	{
		// if it overlaps with this byte, it is on this byte
		bz_assert(this->_bytes.get_ptr(offset) == nullptr);
		return ptrs.front().value;
	}
	else
	{
		return this->_bytes.get(offset);
	}
}

template<typename Prov>
bz::optional<Prov> provenance_map<Prov>::get_ptr(uint64_t offset) const
{
	return this->_ptrs.get(offset);
}

template<typename Prov>
bool provenance_map<Prov>::range_empty(alloc_range range, llvm::DataLayout const &data_layout) const
{
	return this->range_get_ptrs(range, data_layout).empty() && this->range_get_bytes(range).empty();
}

template<typename Prov>
bz::vector<Prov> provenance_map<Prov>::provenances(void) const
{
	auto result = this->_ptrs.values();
	result.reserve(this->_ptrs.size() + this->_bytes.size());
	for (auto const &entry : this->_bytes)
	{
		result.push_back(entry.value);
	}
	return result;
}

template<typename Prov>
bool provenance_map<Prov>::is_consistent(llvm::DataLayout const &data_layout) const
{
	if constexpr (!offset_is_addr)
	{
		if (this->_bytes.not_empty())
		{
			return false;
		}
	}

	auto const pointer_size = get_pointer_size(data_layout);
	uint64_t ptrs_end = 0;
	for (auto const &entry : this->_ptrs)
	{
		if (entry.key < ptrs_end)
		{
			return false;
		}
		ptrs_end = entry.key + pointer_size;
	}

	for (auto const &entry : this->_bytes)
	{
		if (!this->range_get_ptrs(alloc_range{ .start = entry.key, .size = 1 }, data_layout).empty())
		{
			return false;
		}
	}
	return true;
}

template<typename Prov>
void provenance_map<Prov>::insert_ptr(uint64_t offset, Prov provenance, llvm::DataLayout const &data_layout)
{
	bz_assert(this->range_empty(alloc_range{ .start = offset, .size = get_pointer_size(data_layout) }, data_layout));
	this->_ptrs.insert(offset, std::move(provenance));
}

template<typename Prov>
alloc_result<none_t> provenance_map<Prov>::clear(alloc_range range, llvm::DataLayout const &data_layout)
{
	auto const start = range.start;
	auto const end = range.end();
	auto const pointer_size = get_pointer_size(data_layout);

#ifndef NDEBUG
	if (global_data::debug_provenance_trace)
	{
		bz::log("prov: clear: {}\n", range);
	}
#endif // !NDEBUG

	if constexpr (offset_is_addr)
	{
		this->_bytes.remove_range(start, end);
	}
	else
	{
		bz_assert(this->_bytes.empty());
	}

	// the first (inclusive) and last (exclusive) byte of pointer-sized provenance
	// that overlaps with the range
	auto const overlapping = this->range_get_ptrs(range, data_layout);
	if (overlapping.empty())
	{
		return none_t{};
	}

	auto const first = overlapping.front().key;
	auto const last = overlapping.back().key + pointer_size;
	[[maybe_unused]] auto const first_prov = overlapping.front().value;
	[[maybe_unused]] auto const last_prov = overlapping.back().value;

	if (first < start)
	{
		if constexpr (!offset_is_addr)
		{
			return alloc_error{ .kind = alloc_error::partial_pointer_overwrite, .offset = first };
		}
		else
		{
#ifndef NDEBUG
			if (global_data::debug_provenance_trace)
			{
				bz::log("prov: clear: keeping bytes {} of {}\n", alloc_range{ .start = first, .size = start - first }, first_prov);
			}
#endif // !NDEBUG
			for (auto const offset : bz::iota(first, start))
			{
				this->_bytes.insert(offset, first_prov);
			}
		}
	}
	if (last > end)
	{
		[[maybe_unused]] auto const begin_of_last = last - pointer_size;
		if constexpr (!offset_is_addr)
		{
			return alloc_error{ .kind = alloc_error::partial_pointer_overwrite, .offset = begin_of_last };
		}
		else
		{
#ifndef NDEBUG
			if (global_data::debug_provenance_trace)
			{
				bz::log("prov: clear: keeping bytes {} of {}\n", alloc_range{ .start = end, .size = last - end }, last_prov);
			}
#endif // !NDEBUG
			for (auto const offset : bz::iota(end, last))
			{
				this->_bytes.insert(offset, last_prov);
			}
		}
	}

	// entries never overlap, so nothing after the last overlapping one starts before `last`
	this->_ptrs.remove_range(first, last);
	bz_assert(this->is_consistent(data_layout));

	return none_t{};
}

template<typename Prov>
alloc_result<provenance_copy<Prov>> provenance_map<Prov>::prepare_copy(
	alloc_range src,
	uint64_t dest,
	uint64_t count,
	llvm::DataLayout const &data_layout
) const
{
	auto const pointer_size = get_pointer_size(data_layout);
	auto const shift_offset = [src, dest](uint64_t i, uint64_t offset) {
		// offset of the current repetition in the destination
		bz_assert(!mul_overflow(src.size, i).overflowed);
		auto const dest_offset = dest + src.size * i;
		return (offset - src.start) + dest_offset;
	};

	// pointer-sized provenance that lies entirely within the source range
	auto const ptrs = src.size < pointer_size
		? bz::array_view<entry_type const>()
		: this->_ptrs.range(src.start, sub_saturating(src.end(), pointer_size - 1));

	provenance_copy<Prov> result;
	result.dest_ptrs.reserve(ptrs.size() * count);
	for (auto const i : bz::iota(uint64_t(0), count))
	{
		for (auto const &[offset, provenance] : ptrs)
		{
			result.dest_ptrs.push_back(entry_type{ shift_offset(i, offset), provenance });
		}
	}

	bz::vector<entry_type> bytes;

	// part of a pointer at the start
	auto const start_ptrs = this->range_get_ptrs(alloc_range{ .start = src.start, .size = 0 }, data_layout);
	if (!start_ptrs.empty())
	{
		auto const &entry = start_ptrs.front();
		if constexpr (!offset_is_addr)
		{
			return alloc_error{ .kind = alloc_error::partial_pointer_copy, .offset = entry.key };
		}
		else
		{
#ifndef NDEBUG
			if (global_data::debug_provenance_trace)
			{
				bz::log("prov: prepare_copy: start overlapping entry at {}: {}\n", entry.key, entry.value);
			}
#endif // !NDEBUG
			// make sure we don't run off the end of the source range for really small copies
			auto const entry_end = std::min(entry.key + pointer_size, src.end());
			for (auto const offset : bz::iota(src.start, entry_end))
			{
				bytes.push_back(entry_type{ offset, entry.value });
			}
		}
	}

	// bytewise provenance inside the range
	if constexpr (offset_is_addr)
	{
		for (auto const &entry : this->range_get_bytes(src))
		{
			bytes.push_back(entry);
		}
	}
	else
	{
		bz_assert(this->_bytes.empty());
	}

	// part of a pointer at the end
	auto const end_ptrs = this->range_get_ptrs(alloc_range{ .start = src.end(), .size = 0 }, data_layout);
	if (!end_ptrs.empty())
	{
		auto const &entry = end_ptrs.front();
		if constexpr (!offset_is_addr)
		{
			return alloc_error{ .kind = alloc_error::partial_pointer_copy, .offset = entry.key };
		}
		else
		{
#ifndef NDEBUG
			if (global_data::debug_provenance_trace)
			{
				bz::log("prov: prepare_copy: end overlapping entry at {}: {}\n", entry.key, entry.value);
			}
#endif // !NDEBUG
			// make sure we don't start before the source range for really small copies
			auto const entry_start = std::max(entry.key, src.start);
			for (auto const offset : bz::iota(entry_start, src.end()))
			{
				if (bytes.empty() || bytes.back().key < offset)
				{
					bytes.push_back(entry_type{ offset, entry.value });
				}
				else
				{
					// the start and end probes hit the same pointer, which was already added above
					bz_assert(entry.key <= src.start);
				}
			}
		}
	}

	result.dest_bytes.reserve(bytes.size() * count);
	for (auto const i : bz::iota(uint64_t(0), count))
	{
		for (auto const &[offset, provenance] : bytes)
		{
			result.dest_bytes.push_back(entry_type{ shift_offset(i, offset), provenance });
		}
	}

#ifndef NDEBUG
	if (global_data::debug_provenance_trace)
	{
		bz::log(
			"prov: prepare_copy: {} -> {} (x{}): {} pointer entries, {} byte entries\n",
			src, dest, count, result.dest_ptrs.size(), result.dest_bytes.size()
		);
	}
#endif // !NDEBUG

	return result;
}

template<typename Prov>
void provenance_map<Prov>::apply_copy(provenance_copy<Prov> copy)
{
	this->_ptrs.insert_presorted(copy.dest_ptrs);
	if constexpr (offset_is_addr)
	{
		this->_bytes.insert_presorted(copy.dest_bytes);
	}
	else
	{
		bz_assert(copy.dest_bytes.empty());
	}
}

template struct provenance_map<alloc_id>;
template struct provenance_map<exposed_provenance>;

} // namespace prov::memory
