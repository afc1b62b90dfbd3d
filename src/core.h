#ifndef CORE_H
#define CORE_H

#include <utility>
#include <algorithm>
#include <chrono>

#include <cstdint>
#include <cstring>

#include <bz/core.h>
#include <bz/vector.h>
#include <bz/array_view.h>
#include <bz/optional.h>
#include <bz/result.h>
#include <bz/format.h>
#include <bz/u8string.h>
#include <bz/u8string_view.h>

#undef min
#undef max

using std::int8_t;
using std::int16_t;
using std::int32_t;
using std::int64_t;
using std::uint8_t;
using std::uint16_t;
using std::uint32_t;
using std::uint64_t;

template<size_t N>
constexpr uint64_t bit_at = uint64_t(1) << N;

namespace prov
{

struct none_t
{};

} // namespace prov

#endif // CORE_H
