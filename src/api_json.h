#ifndef API_JSON_H
#define API_JSON_H

#include "item_t.h"
#include "query_t.h"
#include "release_t.h"

#include <nlohmann/json_fwd.hpp>

#include <string>

// ============================================================================
// API JSON Mapping
// ============================================================================

namespace ApiJson {

// Accepts both a search hit and a full project object. A project object's
// "versions" holds release ids, so "game_versions" is read first.
[[nodiscard]] Item item_from_json(const nlohmann::json& data);

[[nodiscard]] Release release_from_json(const nlohmann::json& data);

[[nodiscard]] ReleaseFile file_from_json(const nlohmann::json& data);

// [["a","b"],["c"]] as the `facets` query parameter expects it.
[[nodiscard]] std::string encode_groups(const FilterGroups& groups);

} // namespace ApiJson

#endif
