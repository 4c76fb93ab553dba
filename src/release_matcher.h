#ifndef RELEASE_MATCHER_H
#define RELEASE_MATCHER_H

#include "release_t.h"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

// ============================================================================
// Release Matcher
// ============================================================================

// "1.20.1 fabric", "v1.21", "neoforge": at most one version word and at
// most one loader word, at least one of them.
struct QuickDownload {
	std::optional<std::string> version = std::nullopt;
	std::optional<std::string> loader  = std::nullopt;
};

namespace ReleaseMatcher {

// Index of the most mature release that supports both constraints. Equal
// maturity keeps the earliest release in list order. Nothing is matched
// when neither constraint is given.
[[nodiscard]] std::optional<size_t> best_match(const std::vector<Release>& releases,
                                               const std::optional<std::string>& version,
                                               const std::optional<std::string>& loader);

[[nodiscard]] std::optional<QuickDownload> parse_quick_download(const std::string_view input);

} // namespace ReleaseMatcher

#endif
