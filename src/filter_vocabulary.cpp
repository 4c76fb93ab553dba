#include "filter_vocabulary.h"

#include <algorithm>
#include <map>
#include <vector>

// ============================================================================
// Filter Vocabulary
// ============================================================================

namespace Vocabulary {

namespace {

using namespace std::string_view_literals;

struct KindAlias {
	std::string_view token = {};
	std::string_view kind  = {};
};

constexpr std::array<KindAlias, 9> ProjectKinds = {{
        {"mod"sv, "mod"sv},
        {"resourcepack"sv, "resourcepack"sv},
        {"rp"sv, "resourcepack"sv},
        {"datapack"sv, "datapack"sv},
        {"dp"sv, "datapack"sv},
        {"modpack"sv, "modpack"sv},
        {"mp"sv, "modpack"sv},
        {"plugin"sv, "plugin"sv},
        {"shader"sv, "shader"sv},
}};

struct PlatformRule {
	std::string_view token    = {};
	std::string_view included = {};
	std::string_view excluded = {};
};

constexpr std::array<PlatformRule, 6> Platforms = {{
        {"server"sv, "client_side!=required"sv, "client_side:required"sv},
        {"serverside"sv, "client_side!=required"sv, "client_side:required"sv},
        {"client"sv, "server_side!=required"sv, "server_side:required"sv},
        {"clientside"sv, "server_side!=required"sv, "server_side:required"sv},
        {"serversupported"sv, "server_side!=unsupported"sv, "server_side:unsupported"sv},
        {"clientsupported"sv, "client_side!=unsupported"sv, "client_side:unsupported"sv},
}};

struct Parametric {
	std::string_view prefix                  = {};
	std::string (*format)(std::string_view) = nullptr;
};

const std::array<Parametric, 3> ParametricFilters = {{
        {"+v"sv, [](const std::string_view v) { return "versions:" + std::string(v); }},
        {"+t"sv, [](const std::string_view t) { return "categories:" + std::string(t); }},
        {"-t"sv, [](const std::string_view t) { return "categories!=" + std::string(t); }},
}};

using Table = std::map<std::string, std::string, std::less<>>;

[[nodiscard]] Table build_exact_table()
{
	Table table = {};

	for (const auto& [token, kind] : ProjectKinds) {
		table.emplace("+" + std::string(token), "project_type:" + std::string(kind));
		table.emplace("-" + std::string(token), "project_type!=" + std::string(kind));
	}
	for (const auto loader : Loaders) {
		table.emplace("+" + std::string(loader), "categories:" + std::string(loader));
		table.emplace("-" + std::string(loader), "categories!=" + std::string(loader));
	}
	for (const auto& rule : Platforms) {
		table.emplace("+" + std::string(rule.token), std::string(rule.included));
		table.emplace("-" + std::string(rule.token), std::string(rule.excluded));
	}
	return table;
}

[[nodiscard]] const Table& exact_table()
{
	static const Table table = build_exact_table();
	return table;
}

// Members are matched against the unsigned token, or against its type
// character for parametric filters.
[[nodiscard]] std::vector<std::string_view> members_of(const Category category)
{
	std::vector<std::string_view> members = {};

	switch (category) {
	case Category::ProjectKind:
		for (const auto& alias : ProjectKinds) {
			members.push_back(alias.token);
		}
		break;
	case Category::Loader:
		members.assign(Loaders.begin(), Loaders.end());
		break;
	case Category::Platform:
		for (const auto& rule : Platforms) {
			members.push_back(rule.token);
		}
		break;
	case Category::Version: members.push_back("v"sv); break;
	case Category::Tag: members.push_back("t"sv); break;
	}
	return members;
}

} // namespace

[[nodiscard]] bool is_loader(const std::string_view name)
{
	return std::ranges::find(Loaders, name) != Loaders.end();
}

[[nodiscard]] std::optional<SortRule> parse_sort_rule(const std::string_view name)
{
	const auto it = std::ranges::find(SortRules, name);
	if (it == SortRules.end()) {
		return std::nullopt;
	}
	return static_cast<SortRule>(std::distance(SortRules.begin(), it));
}

[[nodiscard]] std::string_view to_string(const SortRule rule)
{
	return SortRules[static_cast<size_t>(rule)];
}

[[nodiscard]] std::optional<std::string> resolve(const std::string_view token)
{
	const auto& table = exact_table();
	if (const auto it = table.find(token); it != table.end()) {
		return it->second;
	}

	if (token.size() <= ParametricPrefixLength) {
		return std::nullopt;
	}

	const auto prefix   = token.substr(0, ParametricPrefixLength);
	const auto argument = token.substr(ParametricPrefixLength);

	for (const auto& filter : ParametricFilters) {
		if (filter.prefix == prefix) {
			return filter.format(argument);
		}
	}
	return std::nullopt;
}

[[nodiscard]] Result<Category> category_of(const std::string_view token)
{
	if (token.size() < 2) {
		return Error{ErrorKind::Internal,
		             "filter \"" + std::string(token) + "\" has no category"};
	}

	const auto name      = token.substr(1);
	const auto type_char = token.substr(1, 1);

	for (size_t i = 0; i < CategoryCount; ++i) {
		const auto category = static_cast<Category>(i);
		const auto members  = members_of(category);

		if (std::ranges::find(members, name) != members.end() ||
		    std::ranges::find(members, type_char) != members.end()) {
			return category;
		}
	}
	return Error{ErrorKind::Internal,
	             "filter \"" + std::string(token) + "\" has no category"};
}

} // namespace Vocabulary
