#include "data_layout.h"
#include "global_data.h"
#include <llvm/Support/Error.h>

namespace prov::memory
{

bz::result<llvm::DataLayout, bz::u8string> make_data_layout(bz::u8string_view layout_string)
{
	auto const layout_string_ref = llvm::StringRef(layout_string.data(), layout_string.size());
	auto data_layout = llvm::DataLayout::parse(layout_string_ref);
	if (!data_layout)
	{
		auto const message = llvm::toString(data_layout.takeError());
		return bz::format(
			"invalid data layout '{}': {}",
			layout_string, bz::u8string_view(message.data(), message.data() + message.size())
		);
	}

	return std::move(*data_layout);
}

bz::result<llvm::DataLayout, bz::u8string> make_default_data_layout(void)
{
	return make_data_layout(global_data::data_layout_string);
}

uint64_t get_pointer_size(llvm::DataLayout const &data_layout)
{
	// only the default address space is modelled
	return data_layout.getPointerSize(0);
}

} // namespace prov::memory
