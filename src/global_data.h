#ifndef GLOBAL_DATA_H
#define GLOBAL_DATA_H

#include "core.h"

namespace prov::global_data
{

// a pointer width of 64 bits is assumed if the host does not specify a target
inline bz::u8string data_layout_string = "e-p:64:64";

#ifndef NDEBUG
inline bool debug_provenance_trace = false;
#endif // !NDEBUG

} // namespace prov::global_data

#endif // GLOBAL_DATA_H
