#include "api_json.h"
#include "utilities.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <stdexcept>

// ============================================================================
// API JSON Mapping
// ============================================================================

namespace ApiJson {

namespace {

using nlohmann::json;

// First key present in `data`, so one mapping serves both object shapes.
[[nodiscard]] const json* first_of(const json& data,
                                   std::initializer_list<const char*> keys)
{
	for (const auto* key : keys) {
		if (const auto it = data.find(key); it != data.end() && !it->is_null()) {
			return &*it;
		}
	}
	return nullptr;
}

[[nodiscard]] std::string string_of(const json& data,
                                    std::initializer_list<const char*> keys)
{
	const auto* value = first_of(data, keys);
	return value ? value->get<std::string>() : std::string();
}

[[nodiscard]] std::vector<std::string> strings_of(const json& data,
                                                  std::initializer_list<const char*> keys)
{
	const auto* value = first_of(data, keys);
	return value ? value->get<std::vector<std::string>>() : std::vector<std::string>();
}

[[nodiscard]] std::uint64_t count_of(const json& data, const char* key)
{
	return data.value(key, std::uint64_t{0});
}

} // namespace

[[nodiscard]] Item item_from_json(const nlohmann::json& data)
{
	if (!data.is_object()) {
		throw std::invalid_argument("project is not an object");
	}

	Item item = {.id             = string_of(data, {"project_id", "id"}),
	             .slug           = string_of(data, {"slug"}),
	             .kind           = string_of(data, {"project_type"}),
	             .title          = string_of(data, {"title"}),
	             .author         = string_of(data, {"author", "team"}),
	             .description    = string_of(data, {"description"}),
	             .downloads      = count_of(data, "downloads"),
	             .follows        = count_of(data, "follows"),
	             .categories     = strings_of(data, {"categories"}),
	             .game_versions  = strings_of(data, {"game_versions", "versions"}),
	             .date_created   = string_of(data, {"date_created", "published"}),
	             .date_modified  = string_of(data, {"date_modified", "updated"}),
	             .client_support = string_of(data, {"client_side"}),
	             .server_support = string_of(data, {"server_side"})};

	// Search hits carry the license id, project objects a license object
	if (const auto* license = first_of(data, {"license"})) {
		item.license = license->is_object() ? license->value("id", std::string())
		                                    : license->get<std::string>();
	}

	// Project objects list loaders apart from categories
	for (const auto& loader : strings_of(data, {"loaders"})) {
		if (std::ranges::find(item.categories, loader) == item.categories.end()) {
			item.categories.push_back(loader);
		}
	}

	partition_categories(item);
	return item;
}

[[nodiscard]] ReleaseFile file_from_json(const nlohmann::json& data)
{
	return {.url      = data.at("url").get<std::string>(),
	        .filename = Util::base_name(data.at("filename").get<std::string>()),
	        .size     = data.value("size", std::uint64_t{0}),
	        .primary  = data.value("primary", false)};
}

[[nodiscard]] Release release_from_json(const nlohmann::json& data)
{
	if (!data.is_object()) {
		throw std::invalid_argument("version is not an object");
	}

	Release release = {.id             = data.at("id").get<std::string>(),
	                   .version_number = string_of(data, {"version_number"}),
	                   .name           = string_of(data, {"name"}),
	                   .downloads      = count_of(data, "downloads"),
	                   .game_versions  = strings_of(data, {"game_versions"}),
	                   .loaders        = strings_of(data, {"loaders"})};

	const auto type = string_of(data, {"version_type"});
	const auto maturity = parse_maturity(type);
	if (!maturity) {
		throw std::invalid_argument("unknown version_type \"" + type + "\"");
	}
	release.maturity = *maturity;

	if (const auto* files = first_of(data, {"files"})) {
		for (const auto& file : *files) {
			release.files.push_back(file_from_json(file));
		}
	}
	ensure_primary(release.files);

	if (const auto* dependencies = first_of(data, {"dependencies"})) {
		for (const auto& dependency : *dependencies) {
			if (dependency.value("dependency_type", std::string()) != "required") {
				continue;
			}
			if (const auto* id = first_of(dependency, {"project_id"})) {
				release.dependencies.push_back(id->get<std::string>());
			}
		}
	}
	return release;
}

[[nodiscard]] std::string encode_groups(const FilterGroups& groups)
{
	return json(groups).dump();
}

} // namespace ApiJson
