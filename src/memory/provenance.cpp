#include "provenance.h"

namespace prov::memory
{

bz::u8string alloc_error::get_message(void) const
{
	switch (this->kind)
	{
	case partial_pointer_overwrite:
		return bz::format("partial pointer overwrite at offset {}", this->offset);
	case partial_pointer_copy:
		return bz::format("partial pointer copy at offset {}", this->offset);
	}
	bz_unreachable;
}

} // namespace prov::memory
