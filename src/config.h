#ifndef CONFIG_H
#define CONFIG_H

#include "error_t.h"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

// ============================================================================
// Configuration
// ============================================================================

namespace Defaults {
constexpr std::string_view ApiUrl      = "https://api.modrinth.com/v2";
constexpr std::string_view DownloadDir = "downloads";
constexpr std::string_view Version     = "1.0.0";
constexpr size_t PageSize              = 20;
constexpr size_t ChunkSize             = 8192;
} // namespace Defaults

struct Config {
	std::string api_url                = std::string(Defaults::ApiUrl);
	std::filesystem::path download_dir = Defaults::DownloadDir;
	size_t page_size                   = Defaults::PageSize;
	size_t chunk_size                  = Defaults::ChunkSize;
	std::string user_agent = "modseek/" + std::string(Defaults::Version);
};

namespace tinyxml2 { class XMLElement; }

// Reads <Modseek> settings files:
//
//   <Modseek>
//     <ApiUrl>https://api.modrinth.com/v2</ApiUrl>
//     <DownloadDir>/home/me/mods</DownloadDir>
//     <PageSize>20</PageSize>
//     <ChunkSize>8192</ChunkSize>
//     <UserAgent>modseek/1.0.0</UserAgent>
//   </Modseek>
class ConfigLoader {
	static constexpr auto get_text = [](const auto* parent, const char* tag) {
		const auto* elem = parent->FirstChildElement(tag);
		return elem ? elem->GetText() : nullptr;
	};

	[[nodiscard]] static std::optional<Error> read_size(const tinyxml2::XMLElement* root,
	                                                    const char* tag, size_t& out);

	[[nodiscard]] static Result<Config> parse_root(const tinyxml2::XMLElement* root);

public:
	// $XDG_CONFIG_HOME/modseek/config.xml or ~/.config/modseek/config.xml
	[[nodiscard]] static std::optional<std::filesystem::path> default_path();

	[[nodiscard]] static Result<Config> parse(const std::string_view xml);

	[[nodiscard]] static Result<Config> load(const std::filesystem::path& filename);

	// Defaults when the default file does not exist.
	[[nodiscard]] static Result<Config> load_default();
};

#endif
