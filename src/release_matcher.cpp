#include "release_matcher.h"
#include "filter_vocabulary.h"
#include "utilities.h"

#include <algorithm>
#include <cctype>

// ============================================================================
// Release Matcher
// ============================================================================

namespace ReleaseMatcher {

namespace {

constexpr char VersionPrefix = 'v';

[[nodiscard]] bool contains(const std::vector<std::string>& values,
                            const std::string& value)
{
	return std::ranges::find(values, value) != values.end();
}

// "v1.20.1" -> "1.20.1", "1.20.1" -> "1.20.1", "23w14a" -> "23w14a"
[[nodiscard]] std::optional<std::string> version_of(const std::string_view word)
{
	if (word.size() > 1 && word.front() == VersionPrefix) {
		return std::string(word.substr(1));
	}
	if (!word.empty() && std::isdigit(static_cast<unsigned char>(word.front()))) {
		return std::string(word);
	}
	return std::nullopt;
}

} // namespace

[[nodiscard]] std::optional<size_t> best_match(const std::vector<Release>& releases,
                                               const std::optional<std::string>& version,
                                               const std::optional<std::string>& loader)
{
	if (!version && !loader) {
		return std::nullopt;
	}

	std::optional<size_t> best = std::nullopt;

	for (size_t i = 0; i < releases.size(); ++i) {
		const auto& release = releases[i];

		if (version && !contains(release.game_versions, *version)) {
			continue;
		}
		if (loader && !contains(release.loaders, *loader)) {
			continue;
		}
		if (!best || release.maturity > releases[*best].maturity) {
			best = i;
		}
	}
	return best;
}

[[nodiscard]] std::optional<QuickDownload> parse_quick_download(const std::string_view input)
{
	const auto words = Util::split_words(input);
	if (words.empty()) {
		return std::nullopt;
	}

	QuickDownload request = {};

	for (const auto& word : words) {
		// Loader names win over the version prefix ("vanilla", "velocity")
		if (Vocabulary::is_loader(word)) {
			if (request.loader) {
				return std::nullopt;
			}
			request.loader = word;
		} else if (auto version = version_of(word)) {
			if (request.version) {
				return std::nullopt;
			}
			request.version = std::move(version);
		} else {
			return std::nullopt;
		}
	}
	return request;
}

} // namespace ReleaseMatcher
