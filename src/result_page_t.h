#ifndef RESULT_PAGE_T
#define RESULT_PAGE_T

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <vector>

// ============================================================================
// Result Page
// ============================================================================

template <typename T>
struct ResultPage {
	std::vector<T> items              = {};
	size_t page_index                 = 0;
	size_t page_count                 = 1;
	size_t total_hits                 = 0;
	std::chrono::milliseconds latency = {};
};

// Never returns less than one page.
[[nodiscard]] constexpr size_t compute_page_count(const size_t total_hits,
                                                  const size_t page_size)
{
	if (page_size == 0 || total_hits == 0) {
		return 1;
	}
	return (total_hits + page_size - 1) / page_size;
}

// Wraps a possibly negative page number into [0, page_count).
[[nodiscard]] constexpr size_t wrap_page(const long long page,
                                         const size_t page_count)
{
	const auto count = static_cast<long long>(page_count == 0 ? 1 : page_count);
	return static_cast<size_t>(((page % count) + count) % count);
}

// Client-side slice of an already fetched listing.
template <typename T>
[[nodiscard]] ResultPage<T> paginate(const ResultPage<T>& listing,
                                     const size_t page_index,
                                     const size_t page_size)
{
	ResultPage<T> page = {.page_index = page_index,
	                      .page_count = compute_page_count(listing.items.size(), page_size),
	                      .total_hits = listing.items.size(),
	                      .latency    = listing.latency};

	const size_t begin = std::min(page_index * page_size, listing.items.size());
	const size_t end   = std::min(begin + page_size, listing.items.size());
	page.items.assign(listing.items.begin() + static_cast<std::ptrdiff_t>(begin),
	                  listing.items.begin() + static_cast<std::ptrdiff_t>(end));
	return page;
}

#endif
