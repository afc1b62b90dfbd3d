#ifndef MEMORY_DATA_LAYOUT_H
#define MEMORY_DATA_LAYOUT_H

#include "core.h"
#include <llvm/IR/DataLayout.h>

namespace prov::memory
{

bz::result<llvm::DataLayout, bz::u8string> make_data_layout(bz::u8string_view layout_string);
bz::result<llvm::DataLayout, bz::u8string> make_default_data_layout(void);

uint64_t get_pointer_size(llvm::DataLayout const &data_layout);

} // namespace prov::memory

#endif // MEMORY_DATA_LAYOUT_H
