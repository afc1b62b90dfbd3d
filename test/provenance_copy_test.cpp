#include "test.h"
#include "memory/provenance_map.h"

using namespace prov::memory;

using exposed_map = provenance_map<exposed_provenance>;
using id_map = provenance_map<alloc_id>;

static constexpr exposed_provenance exposed_a = { .id = { 1 }, .permissions = exposed_provenance::read };
static constexpr exposed_provenance exposed_b = { .id = { 2 }, .permissions = exposed_provenance::write };
static constexpr alloc_id id_a = { 1 };
static constexpr alloc_id id_b = { 2 };

template<typename Prov>
static bz::optional<bz::u8string> repeated_pointer_copy_test(Prov provenance, llvm::DataLayout const &data_layout)
{
	auto const pointer_size = get_pointer_size(data_layout);
	provenance_map<Prov> map;
	map.insert_ptr(0, provenance, data_layout);

	auto const copy = map.prepare_copy({ .start = 0, .size = pointer_size }, 100, 3, data_layout);
	assert_false(copy.has_error());

	auto const &dest_ptrs = copy.get_result().dest_ptrs;
	assert_eq(dest_ptrs.size(), 3);
	for (auto const i : bz::iota(uint64_t(0), uint64_t(3)))
	{
		assert_eq(dest_ptrs[i], (provenance_entry<Prov>{ 100 + i * pointer_size, provenance }));
	}
	assert_true(copy.get_result().dest_bytes.empty());

	auto copy_to_apply = copy.get_result();
	map.apply_copy(std::move(copy_to_apply));
	auto const copies_end = 100 + 3 * pointer_size;
	assert_some(map.get_ptr(0), provenance);
	for (auto const offset : bz::iota(uint64_t(100), copies_end))
	{
		assert_some(map.get(offset, data_layout), provenance);
		if ((offset - 100) % pointer_size == 0)
		{
			assert_some(map.get_ptr(offset), provenance);
		}
		else
		{
			assert_none(map.get_ptr(offset));
		}
	}
	assert_none(map.get(99, data_layout));
	assert_none(map.get(copies_end, data_layout));
	assert_true(map.is_consistent(data_layout));

	return {};
}

static bz::optional<bz::u8string> partial_start_copy_test(llvm::DataLayout const &data_layout)
{
	exposed_map map;
	map.insert_ptr(0, exposed_a, data_layout);
	map.insert_ptr(8, exposed_b, data_layout);

	// copies the last 3 bytes of the first pointer and the whole second one
	auto const copy = map.prepare_copy({ .start = 5, .size = 11 }, 40, 1, data_layout);
	assert_false(copy.has_error());

	auto const &result = copy.get_result();
	assert_eq(result.dest_ptrs.size(), 1);
	assert_eq(result.dest_ptrs[0], (provenance_entry<exposed_provenance>{ 43, exposed_b }));
	assert_eq(result.dest_bytes.size(), 3);
	assert_eq(result.dest_bytes[0], (provenance_entry<exposed_provenance>{ 40, exposed_a }));
	assert_eq(result.dest_bytes[1], (provenance_entry<exposed_provenance>{ 41, exposed_a }));
	assert_eq(result.dest_bytes[2], (provenance_entry<exposed_provenance>{ 42, exposed_a }));

	return {};
}

static bz::optional<bz::u8string> partial_end_copy_test(llvm::DataLayout const &data_layout)
{
	exposed_map map;
	map.insert_ptr(0, exposed_a, data_layout);
	map.insert_ptr(8, exposed_b, data_layout);

	// copies the whole first pointer and the first 2 bytes of the second one
	auto const copy = map.prepare_copy({ .start = 0, .size = 10 }, 64, 2, data_layout);
	assert_false(copy.has_error());

	auto const &result = copy.get_result();
	assert_eq(result.dest_ptrs.size(), 2);
	assert_eq(result.dest_ptrs[0], (provenance_entry<exposed_provenance>{ 64, exposed_a }));
	assert_eq(result.dest_ptrs[1], (provenance_entry<exposed_provenance>{ 74, exposed_a }));
	assert_eq(result.dest_bytes.size(), 4);
	assert_eq(result.dest_bytes[0], (provenance_entry<exposed_provenance>{ 72, exposed_b }));
	assert_eq(result.dest_bytes[1], (provenance_entry<exposed_provenance>{ 73, exposed_b }));
	assert_eq(result.dest_bytes[2], (provenance_entry<exposed_provenance>{ 82, exposed_b }));
	assert_eq(result.dest_bytes[3], (provenance_entry<exposed_provenance>{ 83, exposed_b }));

	return {};
}

static bz::optional<bz::u8string> copy_inside_pointer_test(llvm::DataLayout const &data_layout)
{
	exposed_map map;
	map.insert_ptr(8, exposed_a, data_layout);

	// both ends of the range are inside the same pointer
	auto const copy = map.prepare_copy({ .start = 10, .size = 3 }, 0, 2, data_layout);
	assert_false(copy.has_error());

	auto const &result = copy.get_result();
	assert_true(result.dest_ptrs.empty());
	assert_eq(result.dest_bytes.size(), 6);
	for (auto const i : bz::iota(uint64_t(0), uint64_t(6)))
	{
		assert_eq(result.dest_bytes[i], (provenance_entry<exposed_provenance>{ i, exposed_a }));
	}

	return {};
}

static bz::optional<bz::u8string> bytewise_copy_test(llvm::DataLayout const &data_layout)
{
	exposed_map map;
	map.insert_ptr(0, exposed_a, data_layout);
	map.insert_ptr(16, exposed_b, data_layout);
	// leaves bytes 0..3 of the first pointer
	assert_false(map.clear({ .start = 4, .size = 4 }, data_layout).has_error());

	auto const copy = map.prepare_copy({ .start = 2, .size = 22 }, 32, 1, data_layout);
	assert_false(copy.has_error());

	auto const &result = copy.get_result();
	assert_eq(result.dest_ptrs.size(), 1);
	assert_eq(result.dest_ptrs[0], (provenance_entry<exposed_provenance>{ 46, exposed_b }));
	assert_eq(result.dest_bytes.size(), 2);
	assert_eq(result.dest_bytes[0], (provenance_entry<exposed_provenance>{ 32, exposed_a }));
	assert_eq(result.dest_bytes[1], (provenance_entry<exposed_provenance>{ 33, exposed_a }));

	return {};
}

static bz::optional<bz::u8string> empty_copy_test(llvm::DataLayout const &data_layout)
{
	exposed_map map;
	map.insert_ptr(8, exposed_a, data_layout);

	auto const zero_count = map.prepare_copy({ .start = 0, .size = 24 }, 64, 0, data_layout);
	assert_false(zero_count.has_error());
	assert_true(zero_count.get_result().dest_ptrs.empty());
	assert_true(zero_count.get_result().dest_bytes.empty());

	auto const zero_size = map.prepare_copy({ .start = 24, .size = 0 }, 64, 4, data_layout);
	assert_false(zero_size.has_error());
	assert_true(zero_size.get_result().dest_ptrs.empty());
	assert_true(zero_size.get_result().dest_bytes.empty());

	// a zero-size copy from inside a pointer yields nothing
	auto const zero_size_inside = map.prepare_copy({ .start = 12, .size = 0 }, 64, 1, data_layout);
	assert_false(zero_size_inside.has_error());
	assert_true(zero_size_inside.get_result().dest_bytes.empty());

	auto const no_provenance = map.prepare_copy({ .start = 16, .size = 8 }, 64, 2, data_layout);
	assert_false(no_provenance.has_error());
	assert_true(no_provenance.get_result().dest_ptrs.empty());
	assert_true(no_provenance.get_result().dest_bytes.empty());

	return {};
}

static bz::optional<bz::u8string> partial_pointer_copy_error_test(llvm::DataLayout const &data_layout)
{
	id_map map;
	map.insert_ptr(8, id_a, data_layout);
	map.insert_ptr(24, id_b, data_layout);

	auto const end_result = map.prepare_copy({ .start = 0, .size = 12 }, 64, 1, data_layout);
	assert_true(end_result.has_error());
	assert_eq(end_result.get_error(), (alloc_error{ .kind = alloc_error::partial_pointer_copy, .offset = 8 }));

	auto const start_result = map.prepare_copy({ .start = 12, .size = 12 }, 64, 1, data_layout);
	assert_true(start_result.has_error());
	assert_eq(start_result.get_error(), (alloc_error{ .kind = alloc_error::partial_pointer_copy, .offset = 8 }));

	auto const inside_result = map.prepare_copy({ .start = 26, .size = 0 }, 64, 1, data_layout);
	assert_true(inside_result.has_error());
	assert_eq(inside_result.get_error().offset, 24);

	// whole pointers are fine
	auto const full_result = map.prepare_copy({ .start = 8, .size = 24 }, 64, 1, data_layout);
	assert_false(full_result.has_error());
	assert_eq(full_result.get_result().dest_ptrs.size(), 2);
	assert_eq(full_result.get_result().dest_ptrs[1], (provenance_entry<alloc_id>{ 80, id_b }));

	return {};
}

static bz::optional<bz::u8string> copy_between_maps_test(llvm::DataLayout const &data_layout)
{
	id_map src;
	src.insert_ptr(0, id_a, data_layout);
	src.insert_ptr(8, id_b, data_layout);

	id_map dest;
	dest.insert_ptr(0, id_b, data_layout);
	dest.insert_ptr(40, id_a, data_layout);

	// the copied entries land between the existing ones
	auto copy = src.prepare_copy({ .start = 0, .size = 16 }, 16, 1, data_layout);
	assert_false(copy.has_error());
	assert_false(dest.clear({ .start = 16, .size = 16 }, data_layout).has_error());
	dest.apply_copy(std::move(copy).get_result());

	assert_true(dest.is_consistent(data_layout));
	auto const ptrs = dest.ptrs().as_array_view();
	assert_eq(ptrs.size(), 4);
	assert_eq(ptrs[0], (provenance_entry<alloc_id>{ 0, id_b }));
	assert_eq(ptrs[1], (provenance_entry<alloc_id>{ 16, id_a }));
	assert_eq(ptrs[2], (provenance_entry<alloc_id>{ 24, id_b }));
	assert_eq(ptrs[3], (provenance_entry<alloc_id>{ 40, id_a }));

	return {};
}

static bz::optional<bz::u8string> overlapping_copy_test(llvm::DataLayout const &data_layout)
{
	exposed_map map;
	map.insert_ptr(0, exposed_a, data_layout);
	map.insert_ptr(8, exposed_b, data_layout);

	// shift the contents of [0, 16) up by 4 bytes
	alloc_range const src = { .start = 0, .size = 16 };
	auto copy = map.prepare_copy(src, 4, 1, data_layout);
	assert_false(copy.has_error());
	assert_false(map.clear({ .start = 4, .size = 16 }, data_layout).has_error());
	map.apply_copy(std::move(copy).get_result());

	assert_true(map.is_consistent(data_layout));
	for (auto const offset : bz::iota(0, 12))
	{
		assert_some(map.get(offset, data_layout), exposed_a);
	}
	for (auto const offset : bz::iota(12, 20))
	{
		assert_some(map.get(offset, data_layout), exposed_b);
	}
	assert_some(map.get_ptr(4), exposed_a);
	assert_some(map.get_ptr(12), exposed_b);
	assert_false(map.bytes_empty());

	return {};
}

test_result provenance_copy_test(llvm::DataLayout const &target_data_layout)
{
	test_begin();

	// the fixed offsets in most tests assume 8 byte pointers
	auto const data_layout = make_test_data_layout("e-p:64:64");

	test_fn(repeated_pointer_copy_test<alloc_id>, id_a, target_data_layout);
	test_fn(repeated_pointer_copy_test<exposed_provenance>, exposed_a, target_data_layout);
	test_fn(partial_start_copy_test, data_layout);
	test_fn(partial_end_copy_test, data_layout);
	test_fn(copy_inside_pointer_test, data_layout);
	test_fn(bytewise_copy_test, data_layout);
	test_fn(empty_copy_test, data_layout);
	test_fn(partial_pointer_copy_error_test, data_layout);
	test_fn(copy_between_maps_test, data_layout);
	test_fn(overlapping_copy_test, data_layout);

	test_end();
}
