#ifndef MEMORY_PROVENANCE_H
#define MEMORY_PROVENANCE_H

#include "core.h"

namespace prov::memory
{

struct alloc_range
{
	uint64_t start;
	uint64_t size;

	uint64_t end(void) const noexcept
	{ return this->start + this->size; }

	bool operator == (alloc_range const &other) const = default;
};

/// Capability of a provenance kind.
/// `offset_is_addr` is true if the numeric address of a pointer is meaningful
/// on its own, in which case the provenance of a pointer may be split into
/// per-byte provenance when only a part of the pointer is overwritten or copied.
template<typename Prov>
struct provenance_traits;

/// Identifies an abstract memory object.
/// Plain allocation ids cannot be split: they only ever exist for a whole pointer.
struct alloc_id
{
	uint64_t value;

	bool operator == (alloc_id const &other) const = default;
};

template<>
struct provenance_traits<alloc_id>
{
	static constexpr bool offset_is_addr = false;
};

/// Provenance of a pointer whose address has been exposed, together with
/// the access permissions it was created with.
struct exposed_provenance
{
	enum permission : uint32_t
	{
		read  = bit_at<0>,
		write = bit_at<1>,
	};

	alloc_id id;
	uint32_t permissions;

	bool operator == (exposed_provenance const &other) const = default;
};

template<>
struct provenance_traits<exposed_provenance>
{
	static constexpr bool offset_is_addr = true;
};

struct alloc_error
{
	enum kind_t : uint8_t
	{
		// a write would only overwrite a part of a pointer
		partial_pointer_overwrite,
		// a copy would only copy a part of a pointer
		partial_pointer_copy,
	};

	kind_t kind;
	uint64_t offset;

	bz::u8string get_message(void) const;

	bool operator == (alloc_error const &other) const = default;
};

template<typename T>
using alloc_result = bz::result<T, alloc_error>;

} // namespace prov::memory

template<>
struct bz::formatter<prov::memory::alloc_range>
{
	static bz::u8string format(prov::memory::alloc_range range, bz::u8string_view)
	{
		return bz::format("[{}, {})", range.start, range.end());
	}
};

template<>
struct bz::formatter<prov::memory::alloc_id>
{
	static bz::u8string format(prov::memory::alloc_id id, bz::u8string_view)
	{
		return bz::format("alloc{}", id.value);
	}
};

template<>
struct bz::formatter<prov::memory::exposed_provenance>
{
	static bz::u8string format(prov::memory::exposed_provenance provenance, bz::u8string_view)
	{
		return bz::format("alloc{}<0x{:x}>", provenance.id.value, provenance.permissions);
	}
};

template<>
struct bz::formatter<prov::memory::alloc_error>
{
	static bz::u8string format(prov::memory::alloc_error const &error, bz::u8string_view)
	{
		return error.get_message();
	}
};

#endif // MEMORY_PROVENANCE_H
