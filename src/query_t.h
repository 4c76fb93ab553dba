#ifndef QUERY_T
#define QUERY_T

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// ============================================================================
// Compiled Query
// ============================================================================

enum class SortRule {
	Relevance,
	Downloads,
	Follows,
	Newest,
	Updated,
};

// Outer vector is ANDed, inner vector is ORed.
using FilterGroups = std::vector<std::vector<std::string>>;

struct CompiledQuery {
	std::string term             = {};
	FilterGroups groups          = {};
	std::optional<SortRule> sort = std::nullopt;
	size_t page_index            = 0;
	size_t page_size             = 20;

	[[nodiscard]] size_t offset() const { return page_index * page_size; }

	[[nodiscard]] CompiledQuery at_page(const size_t page) const
	{
		CompiledQuery copy = *this;
		copy.page_index    = page;
		return copy;
	}
};

#endif
