#ifndef SLIDEC_SETTINGS_HPP
#define SLIDEC_SETTINGS_HPP

#include <cstddef>

#ifndef NDEBUG // debug builds
#define SLIDEC_IF_DEBUG(...) __VA_ARGS__
#else // release builds
#define SLIDEC_IF_DEBUG(...)
#endif

namespace slidec {

/// @brief The initial capacity of the buffer that a section body is rendered into.
inline constexpr std::size_t section_body_buffer_size = 1024;

/// @brief The greatest heading depth that the default HTML rules distinguish.
/// Deeper sections are rendered with `<h6>`.
inline constexpr std::size_t max_html_heading_level = 6;

} // namespace slidec

#endif
