#ifndef ITEM_T
#define ITEM_T

#include "filter_vocabulary.h"

#include <cstdint>
#include <string>
#include <vector>

// ============================================================================
// Item
// ============================================================================

struct Item {
	std::string id             = {};
	std::string slug           = {};
	std::string kind           = {};
	std::string title          = {};
	std::string author         = {};
	std::string description    = {};
	std::uint64_t downloads    = {};
	std::uint64_t follows      = {};
	std::vector<std::string> categories = {};
	std::vector<std::string> game_versions = {};
	std::string date_created   = {};
	std::string date_modified  = {};
	std::string license        = {};
	std::string client_support = {};
	std::string server_support = {};

	// Derived from categories by partition_categories()
	std::vector<std::string> loaders = {};
	std::vector<std::string> tags    = {};
};

// Splits categories into loader names and topic tags. Call after the
// category list is filled in.
inline void partition_categories(Item& item)
{
	item.loaders.clear();
	item.tags.clear();
	for (const auto& category : item.categories) {
		if (Vocabulary::is_loader(category)) {
			item.loaders.push_back(category);
		} else {
			item.tags.push_back(category);
		}
	}
}

#endif
