#ifndef RELEASE_T
#define RELEASE_T

#include "item_t.h"

#include <algorithm>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// ============================================================================
// Release
// ============================================================================

// Ordered: a higher value is more mature.
enum class Maturity {
	Draft  = 0,
	Beta   = 1,
	Stable = 2,
};

[[nodiscard]] inline std::optional<Maturity> parse_maturity(const std::string_view text)
{
	if (text == "release") {
		return Maturity::Stable;
	}
	if (text == "beta") {
		return Maturity::Beta;
	}
	if (text == "alpha") {
		return Maturity::Draft;
	}
	return std::nullopt;
}

[[nodiscard]] constexpr std::string_view to_string(const Maturity maturity)
{
	switch (maturity) {
	case Maturity::Draft: return "alpha";
	case Maturity::Beta: return "beta";
	case Maturity::Stable: return "release";
	}
	return "unknown";
}

struct ReleaseFile {
	std::string url       = {};
	std::string filename  = {}; // basename only
	std::uint64_t size    = {};
	bool primary          = false;
};

struct Release {
	std::string id                        = {};
	Maturity maturity                     = Maturity::Stable;
	std::string version_number            = {};
	std::string name                      = {};
	std::uint64_t downloads               = {};
	std::vector<std::string> game_versions = {};
	std::vector<std::string> loaders      = {};
	std::vector<ReleaseFile> files        = {};
	std::vector<std::string> dependencies = {}; // required item ids

	// Filled in on first download, never refetched.
	mutable std::optional<std::vector<Item>> dependency_items = {};

	[[nodiscard]] const ReleaseFile* primary_file() const
	{
		for (const auto& file : files) {
			if (file.primary) {
				return &file;
			}
		}
		return files.empty() ? nullptr : &files.front();
	}
};

// Marks the first file primary when the server marked none.
inline void ensure_primary(std::vector<ReleaseFile>& files)
{
	const bool has_primary = std::ranges::any_of(files, [](const auto& f) {
		return f.primary;
	});
	if (!has_primary && !files.empty()) {
		files.front().primary = true;
	}
}

#endif
