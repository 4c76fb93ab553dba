#ifndef UTILITIES_H
#define UTILITIES_H

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

// ============================================================================
// Utilities
// ============================================================================

namespace Util {

[[nodiscard]] std::string capitalize(const std::string_view s);

// Whitespace separated, empty words dropped.
[[nodiscard]] std::vector<std::string> split_words(const std::string_view text);

[[nodiscard]] std::string join(const std::vector<std::string>& words,
                               const std::string_view separator);

[[nodiscard]] bool is_digits(const std::string_view s);

// Final path component of a server-provided name, '/' and '\' both count.
[[nodiscard]] std::string base_name(const std::string_view path);

// Cuts to `width` columns with a trailing ellipsis, pads when asked.
[[nodiscard]] std::string truncate(const std::string_view text, const size_t width,
                                   const bool pad = true);

// 1234567 -> "1,234,567"
[[nodiscard]] std::string group_thousands(const std::uint64_t value);

// 1536 -> "1.5 KiB"
[[nodiscard]] std::string format_bytes(const std::uint64_t bytes);

void clear_screen();

} // namespace Util

#endif
