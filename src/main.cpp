// An interactive CLI search & download tool for Modrinth
// Copyright (C) 2025 The modseek authors
// Licensed under GNU GPL v3+

#include "application.h"
#include "config.h"
#include "exit_codes_t.h"
#include "http_client.h"
#include "utilities.h"

#include <cstring>
#include <iostream>
#include <string>
#include <vector>

// ============================================================================
// Main
// ============================================================================

namespace {

void print_usage(const char* program)
{
	std::cout << "Usage: " << program
	          << " [-c <config.xml>] [-d <download dir>] [query...]\n\n"
	          << "Options:\n"
	          << "  -c, --config <file>        Read settings from <file>\n"
	          << "  -d, --download-dir <dir>   Save downloads under <dir>/<project slug>\n"
	          << "  -h, --help                 Show this help message\n"
	          << "  -v, --version              Show version\n\n"
	          << "Query words:\n"
	          << "  +mod +rp +dp +mp +plugin +shader   project type\n"
	          << "  +fabric +forge +quilt ...          loader\n"
	          << "  +server +client +serversupported +clientsupported\n"
	          << "  +v<version>                        game version\n"
	          << "  +t<tag> -t<tag>                    tag\n"
	          << "  /relevance /downloads /follows /newest /updated\n\n"
	          << "A '-' in front of a project type, loader or platform excludes it.\n";
}

} // namespace

int main(const int argc, char* const argv[])
{
	try {
		std::string config_path        = {};
		std::string download_dir       = {};
		std::vector<std::string> words = {};

		for (int i = 1; i < argc; ++i) {
			const char* arg = argv[i];

			if (std::strcmp(arg, "-h") == 0 || std::strcmp(arg, "--help") == 0) {
				print_usage(argv[0]);
				return ExitSuccess;
			}
			if (std::strcmp(arg, "-v") == 0 || std::strcmp(arg, "--version") == 0) {
				std::cout << "modseek version " << Defaults::Version << '\n';
				return ExitSuccess;
			}
			const bool is_config = std::strcmp(arg, "-c") == 0 ||
			                       std::strcmp(arg, "--config") == 0;
			const bool is_dir    = std::strcmp(arg, "-d") == 0 ||
			                    std::strcmp(arg, "--download-dir") == 0;
			if (is_config || is_dir) {
				if (i + 1 >= argc) {
					std::cerr << "Error: " << arg << " needs a value\n";
					return ExitError;
				}
				(is_config ? config_path : download_dir) = argv[++i];
				continue;
			}
			words.emplace_back(arg);
		}

		auto config = config_path.empty() ? ConfigLoader::load_default()
		                                  : ConfigLoader::load(config_path);
		if (const auto* error = std::get_if<Error>(&config)) {
			std::cerr << "Config error: " << error->message << '\n';
			return ExitError;
		}

		auto& settings = std::get<Config>(config);
		if (!download_dir.empty()) {
			settings.download_dir = download_dir;
		}

		const CurlSession session;
		Application app(settings, std::cin);
		return app.run(Util::join(words, " "));
	} catch (const std::exception& e) {
		std::cerr << "Fatal error in main: " << e.what() << '\n';
		return ExitError;
	}
}
