#include "downloader.h"
#include "utilities.h"

#include <fstream>
#include <system_error>

// ============================================================================
// Downloader
// ============================================================================

Downloader::Downloader(Transport& transport, std::filesystem::path root)
        : transport_(transport),
          root_(std::move(root))
{}

[[nodiscard]] std::filesystem::path Downloader::target_path(const std::string& item_slug,
                                                            const ReleaseFile& file) const
{
	return root_ / Util::base_name(item_slug) / Util::base_name(file.filename);
}

[[nodiscard]] Result<std::filesystem::path> Downloader::download(
        const std::string& item_slug,
        const ReleaseFile& file,
        const ProgressCallback& progress) const
{
	const auto path = target_path(item_slug, file);

	std::error_code ec = {};
	std::filesystem::create_directories(path.parent_path(), ec);
	if (ec) {
		return Error{ErrorKind::Resource,
		             "cannot create " + path.parent_path().string() + ": " + ec.message()};
	}

	std::ofstream out(path, std::ios::binary | std::ios::trunc);
	if (!out) {
		return Error{ErrorKind::Resource, "cannot open " + path.string() + " for writing"};
	}

	std::uint64_t done = 0;
	bool write_failed  = false;

	const auto response = transport_.stream(file.url, [&](const std::string_view chunk) {
		out.write(chunk.data(), static_cast<std::streamsize>(chunk.size()));
		if (!out) {
			write_failed = true;
			return false;
		}
		done += chunk.size();
		if (progress) {
			progress(file, done, file.size);
		}
		return true;
	});

	if (write_failed) {
		return Error{ErrorKind::Resource, "write to " + path.string() + " failed"};
	}
	if (!response.received()) {
		return Error{ErrorKind::Transport,
		             "download of " + file.url + " failed: " + response.error};
	}
	if (!response.ok()) {
		return Error{ErrorKind::Transport,
		             "download of " + file.url + " returned HTTP " +
		                     std::to_string(response.status)};
	}

	out.close();
	if (!out) {
		return Error{ErrorKind::Resource, "closing " + path.string() + " failed"};
	}
	return path;
}

[[nodiscard]] Result<std::vector<std::filesystem::path>> Downloader::download_all(
        const std::string& item_slug,
        const std::vector<ReleaseFile>& files,
        const ProgressCallback& progress) const
{
	std::vector<std::filesystem::path> written = {};

	for (const auto& file : files) {
		auto result = download(item_slug, file, progress);
		if (const auto* error = error_of(result)) {
			return *error;
		}
		written.push_back(std::move(std::get<std::filesystem::path>(result)));
	}
	return written;
}
