#ifndef SLIDEC_ANSI_HPP
#define SLIDEC_ANSI_HPP

#include <string_view>

namespace slidec::ansi {

// High-intensity colors

inline constexpr std::u8string_view h_black = u8"\x1B[0;90m";
inline constexpr std::u8string_view h_red = u8"\x1B[0;91m";
inline constexpr std::u8string_view h_green = u8"\x1B[0;92m";
inline constexpr std::u8string_view h_yellow = u8"\x1B[0;93m";
inline constexpr std::u8string_view h_blue = u8"\x1B[0;94m";
inline constexpr std::u8string_view h_magenta = u8"\x1B[0;95m";
inline constexpr std::u8string_view h_white = u8"\x1B[0;97m";

// Other sequences

inline constexpr std::u8string_view reset = u8"\033[0m";

} // namespace slidec::ansi

#endif
