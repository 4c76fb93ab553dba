#ifndef FILTER_VOCABULARY_H
#define FILTER_VOCABULARY_H

#include "error_t.h"
#include "query_t.h"

#include <array>
#include <optional>
#include <string>
#include <string_view>

// ============================================================================
// Filter Vocabulary
// ============================================================================

namespace Vocabulary {

// Order here is the order of the OR-groups in a compiled query.
enum class Category {
	ProjectKind,
	Loader,
	Platform,
	Version,
	Tag,
};

constexpr size_t CategoryCount = 5;

// Every parametric prefix is a sign plus one type character.
constexpr size_t ParametricPrefixLength = 2;

constexpr std::array<std::string_view, 20> Loaders = {
        "bukkit",     "bungeecord", "canvas",    "fabric", "folia",
        "forge",      "iris",       "liteloader", "modloader", "neoforge",
        "optifine",   "paper",      "purpur",    "quilt",  "rift",
        "spigot",     "sponge",     "vanilla",   "velocity", "waterfall"};

constexpr std::array<std::string_view, 5> SortRules = {
        "relevance", "downloads", "follows", "newest", "updated"};

[[nodiscard]] bool is_loader(const std::string_view name);

[[nodiscard]] std::optional<SortRule> parse_sort_rule(const std::string_view name);

[[nodiscard]] std::string_view to_string(const SortRule rule);

// Exact tokens first, then parametric prefixes. Returns the API clause.
[[nodiscard]] std::optional<std::string> resolve(const std::string_view token);

// Token includes its sign. Failure is an Internal error: any token that
// resolve() accepted must belong to a category.
[[nodiscard]] Result<Category> category_of(const std::string_view token);

} // namespace Vocabulary

#endif
