#ifndef DOWNLOADER_H
#define DOWNLOADER_H

#include "error_t.h"
#include "http_client.h"
#include "release_t.h"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

// ============================================================================
// Downloader
// ============================================================================

// bytes written so far, expected total from the release metadata
using ProgressCallback = std::function<void(const ReleaseFile& file,
                                            std::uint64_t done,
                                            std::uint64_t total)>;

// Streams release files into <root>/<item slug>/<file name>, one at a time.
// A failed file stops the batch; files finished before it stay on disk and
// a partial file is left as is.
class Downloader {
	Transport& transport_;
	std::filesystem::path root_ = {};

public:
	Downloader(Transport& transport, std::filesystem::path root);

	[[nodiscard]] std::filesystem::path target_path(const std::string& item_slug,
	                                                const ReleaseFile& file) const;

	[[nodiscard]] Result<std::filesystem::path> download(const std::string& item_slug,
	                                                     const ReleaseFile& file,
	                                                     const ProgressCallback& progress) const;

	[[nodiscard]] Result<std::vector<std::filesystem::path>> download_all(
	        const std::string& item_slug,
	        const std::vector<ReleaseFile>& files,
	        const ProgressCallback& progress) const;
};

#endif
