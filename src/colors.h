#ifndef COLORS_H
#define COLORS_H

#include <bz/u8string_view.h>

namespace colors
{

constexpr bz::u8string_view clear = "\033[0m";

constexpr bz::u8string_view bright_red    = "\033[91m";
constexpr bz::u8string_view bright_green  = "\033[92m";
constexpr bz::u8string_view bright_white  = "\033[97m";

} // namespace colors

#endif // COLORS_H
