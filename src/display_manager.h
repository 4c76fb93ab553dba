#ifndef DISPLAY_MANAGER_H
#define DISPLAY_MANAGER_H

#include "release_t.h"
#include "screen_t.h"

#include <cstdint>
#include <sstream>
#include <string>

// ============================================================================
// Display Manager
// ============================================================================

class DisplayManager {
	size_t release_page_size_ = 20;

	void render_search(std::ostringstream& buf) const;

	void render_results(std::ostringstream& buf, const ResultsScreen& screen) const;

	void render_item(std::ostringstream& buf, const ItemScreen& screen) const;

	void render_release(std::ostringstream& buf, const ReleaseScreen& screen) const;

	void render_item_row(std::ostringstream& buf, const Item& item, size_t number) const;

	void render_release_row(std::ostringstream& buf, const Release& release,
	                        size_t number) const;

public:
	explicit DisplayManager(const size_t release_page_size);

	void render(const Screen& screen) const;

	[[nodiscard]] std::string prompt(const Screen& screen) const;

	// Single line, redrawn in place.
	void show_progress(const ReleaseFile& file, const std::uint64_t done,
	                   const std::uint64_t total) const;
};

#endif
