#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wsign-conversion"
#include <tinyxml2.h>
#pragma GCC diagnostic pop

#include "config.h"

#include <charconv>
#include <cstdlib>
#include <cstring>

// ============================================================================
// Configuration
// ============================================================================

[[nodiscard]] std::optional<Error> ConfigLoader::read_size(const tinyxml2::XMLElement* root,
                                                           const char* tag, size_t& out)
{
	const auto* text = get_text(root, tag);
	if (!text) {
		return std::nullopt;
	}

	size_t value     = 0;
	const auto* end  = text + std::strlen(text);
	const auto [ptr, ec] = std::from_chars(text, end, value);

	if (ec != std::errc{} || ptr != end || value == 0) {
		return Error{ErrorKind::UserInput,
		             std::string("<") + tag + "> must be a positive integer, got \"" +
		                     text + "\""};
	}
	out = value;
	return std::nullopt;
}

[[nodiscard]] Result<Config> ConfigLoader::parse_root(const tinyxml2::XMLElement* root)
{
	if (!root) {
		return Error{ErrorKind::UserInput, "no Modseek root element found"};
	}

	Config config = {};

	if (const auto* url = get_text(root, "ApiUrl")) {
		config.api_url = url;
	}
	if (const auto* dir = get_text(root, "DownloadDir")) {
		config.download_dir = dir;
	}
	if (const auto* agent = get_text(root, "UserAgent")) {
		config.user_agent = agent;
	}
	if (auto error = read_size(root, "PageSize", config.page_size)) {
		return *error;
	}
	if (auto error = read_size(root, "ChunkSize", config.chunk_size)) {
		return *error;
	}
	return config;
}

[[nodiscard]] std::optional<std::filesystem::path> ConfigLoader::default_path()
{
	if (const auto* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
		return std::filesystem::path(xdg) / "modseek" / "config.xml";
	}
	if (const auto* home = std::getenv("HOME"); home && *home) {
		return std::filesystem::path(home) / ".config" / "modseek" / "config.xml";
	}
	return std::nullopt;
}

[[nodiscard]] Result<Config> ConfigLoader::parse(const std::string_view xml)
{
	tinyxml2::XMLDocument doc = {};
	if (doc.Parse(xml.data(), xml.size()) != tinyxml2::XML_SUCCESS) {
		return Error{ErrorKind::UserInput,
		             std::string("malformed configuration: ") + doc.ErrorStr()};
	}
	return parse_root(doc.FirstChildElement("Modseek"));
}

[[nodiscard]] Result<Config> ConfigLoader::load(const std::filesystem::path& filename)
{
	tinyxml2::XMLDocument doc = {};
	if (doc.LoadFile(filename.string().c_str()) != tinyxml2::XML_SUCCESS) {
		return Error{ErrorKind::Resource,
		             "cannot read " + filename.string() + ": " + doc.ErrorStr()};
	}

	auto config = parse_root(doc.FirstChildElement("Modseek"));
	if (auto* error = std::get_if<Error>(&config)) {
		error->message = filename.string() + ": " + error->message;
	}
	return config;
}

[[nodiscard]] Result<Config> ConfigLoader::load_default()
{
	const auto path = default_path();
	std::error_code ec = {};
	if (!path || !std::filesystem::exists(*path, ec)) {
		return Config{};
	}
	return load(*path);
}
