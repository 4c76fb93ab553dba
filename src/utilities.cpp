#include "utilities.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <iomanip>
#include <iostream>
#include <ranges>
#include <sstream>

// ============================================================================
// Utilities
// ============================================================================

namespace Util {

namespace {

// Counts UTF-8 code points, not bytes.
[[nodiscard]] size_t display_length(const std::string_view text)
{
	return static_cast<size_t>(std::ranges::count_if(text, [](const unsigned char c) {
		return (c & 0xC0) != 0x80;
	}));
}

// Byte offset of the code point at `columns`.
[[nodiscard]] size_t byte_offset(const std::string_view text, const size_t columns)
{
	size_t seen = 0;
	for (size_t i = 0; i < text.size(); ++i) {
		if ((static_cast<unsigned char>(text[i]) & 0xC0) != 0x80) {
			if (seen == columns) {
				return i;
			}
			++seen;
		}
	}
	return text.size();
}

} // namespace

[[nodiscard]] std::string capitalize(const std::string_view s)
{
	std::string result(s);
	if (!result.empty()) {
		result[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(result[0])));
	}
	return result;
}

[[nodiscard]] std::vector<std::string> split_words(const std::string_view text)
{
	std::vector<std::string> words = {};
	std::istringstream ss{std::string(text)};

	for (std::string word = {}; ss >> word;) {
		words.emplace_back(std::move(word));
	}
	return words;
}

[[nodiscard]] std::string join(const std::vector<std::string>& words,
                               const std::string_view separator)
{
	std::string result = {};
	for (size_t i = 0; i < words.size(); ++i) {
		if (i > 0) {
			result += separator;
		}
		result += words[i];
	}
	return result;
}

[[nodiscard]] bool is_digits(const std::string_view s)
{
	return !s.empty() && std::ranges::all_of(s, [](const unsigned char c) {
		return std::isdigit(c) != 0;
	});
}

[[nodiscard]] std::string base_name(const std::string_view path)
{
	const auto pos = path.find_last_of("/\\");
	const auto name = (pos == std::string_view::npos) ? path : path.substr(pos + 1);

	if (name.empty() || name == "." || name == "..") {
		return "download";
	}
	return std::string(name);
}

[[nodiscard]] std::string truncate(const std::string_view text, const size_t width,
                                   const bool pad)
{
	const size_t length = display_length(text);

	if (length <= width) {
		std::string result(text);
		if (pad) {
			result.append(width - length, ' ');
		}
		return result;
	}
	if (width == 0) {
		return {};
	}
	return std::string(text.substr(0, byte_offset(text, width - 1))) + "…";
}

[[nodiscard]] std::string group_thousands(const std::uint64_t value)
{
	const std::string digits = std::to_string(value);
	std::string result       = {};

	for (size_t i = 0; i < digits.size(); ++i) {
		if (i > 0 && (digits.size() - i) % 3 == 0) {
			result += ',';
		}
		result += digits[i];
	}
	return result;
}

[[nodiscard]] std::string format_bytes(const std::uint64_t bytes)
{
	constexpr std::array<const char*, 4> Units = {"B", "KiB", "MiB", "GiB"};

	if (bytes < 1024) {
		return std::to_string(bytes) + " B";
	}

	auto value  = static_cast<double>(bytes);
	size_t unit = 0;
	while (value >= 1024.0 && unit + 1 < Units.size()) {
		value /= 1024.0;
		++unit;
	}

	std::ostringstream ss;
	ss << std::fixed << std::setprecision(1) << value << ' ' << Units[unit];
	return ss.str();
}

void clear_screen()
{
	std::cout << "\033[H\033[J";
}

} // namespace Util
