#ifndef MEMORY_PROVENANCE_MAP_H
#define MEMORY_PROVENANCE_MAP_H

#include "core.h"
#include "provenance.h"
#include "sorted_map.h"
#include "data_layout.h"

namespace prov::memory
{

template<typename Prov>
using provenance_entry = sorted_map_entry<uint64_t, Prov>;

/// A partial list of provenance to transfer into an allocation.
/// Offsets are already adjusted to the destination, and both lists are sorted
/// and free of duplicates.
template<typename Prov>
struct provenance_copy
{
	bz::vector<provenance_entry<Prov>> dest_ptrs;
	bz::vector<provenance_entry<Prov>> dest_bytes;
};

/// Stores the provenance of every byte of an allocation, using a single entry
/// for the common case where a whole pointer worth of bytes shares one provenance.
template<typename Prov>
struct provenance_map
{
	static constexpr bool offset_is_addr = provenance_traits<Prov>::offset_is_addr;

	using entry_type = provenance_entry<Prov>;

private:
	// provenance in this map applies from the given offset for pointer size bytes.
	// two entries are always at least a pointer size apart.
	sorted_map<uint64_t, Prov> _ptrs;
	// provenance in this map applies to a single byte.  it is disjoint from `_ptrs`,
	// and is always empty if `offset_is_addr` is false.
	sorted_map<uint64_t, Prov> _bytes;

	bz::array_view<entry_type const> range_get_ptrs(alloc_range range, llvm::DataLayout const &data_layout) const;
	bz::array_view<entry_type const> range_get_bytes(alloc_range range) const;

public:
	provenance_map(void) = default;

	/// The elements must be sorted by offset and must not contain duplicates.
	static provenance_map from_presorted_ptrs(bz::vector<entry_type> ptrs);

	/// The pointer-sized provenance of the allocation.  There must be no bytewise provenance.
	sorted_map<uint64_t, Prov> const &ptrs(void) const;

	bool bytes_empty(void) const noexcept
	{ return this->_bytes.empty(); }

	bz::optional<Prov> get(uint64_t offset, llvm::DataLayout const &data_layout) const;
	bz::optional<Prov> get_ptr(uint64_t offset) const;
	bool range_empty(alloc_range range, llvm::DataLayout const &data_layout) const;
	bz::vector<Prov> provenances(void) const;

	/// Checks that pointer-sized entries don't overlap each other or any bytewise entry.
	bool is_consistent(llvm::DataLayout const &data_layout) const;

	void insert_ptr(uint64_t offset, Prov provenance, llvm::DataLayout const &data_layout);
	[[nodiscard]] alloc_result<none_t> clear(alloc_range range, llvm::DataLayout const &data_layout);

	[[nodiscard]] alloc_result<provenance_copy<Prov>> prepare_copy(
		alloc_range src,
		uint64_t dest,
		uint64_t count,
		llvm::DataLayout const &data_layout
	) const;
	void apply_copy(provenance_copy<Prov> copy);

	bool operator == (provenance_map const &other) const
	{ return this->_ptrs == other._ptrs && this->_bytes == other._bytes; }
};

extern template struct provenance_map<alloc_id>;
extern template struct provenance_map<exposed_provenance>;

} // namespace prov::memory

#endif // MEMORY_PROVENANCE_MAP_H
