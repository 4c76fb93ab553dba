#include "application.h"
#include "exit_codes_t.h"
#include "utilities.h"

#include <iostream>

// ============================================================================
// Application
// ============================================================================

Application::Application(const Config& config, std::istream& in)
        : transport_(config.user_agent, config.chunk_size),
          gateway_(transport_, config.api_url),
          downloader_(transport_, config.download_dir),
          display_(config.page_size),
          navigator_(gateway_, downloader_, QueryCompiler(config.page_size),
                     [this](const ReleaseFile& file, const std::uint64_t done,
                            const std::uint64_t total) {
	                     display_.show_progress(file, done, total);
                     }),
          input_(in),
          screen_(make_screen(SearchScreen{}))
{}

[[nodiscard]] int Application::run(const std::string& initial_query)
{
	using namespace std::string_view_literals;

	try {
		if (!initial_query.empty()) {
			screen_ = navigator_.step(screen_, initial_query);
		}

		while (!holds<QuitScreen>(*screen_)) {
			display_.render(*screen_);

			const auto line = input_.read_line(display_.prompt(*screen_));
			if (!line) {
				break;
			}

			try {
				screen_ = navigator_.step(screen_, *line);
			} catch (const std::exception& e) {
				std::cerr << "Input error: "sv << e.what() << '\n';
				screen_ = error_screen(Error{ErrorKind::Internal, e.what()}, screen_);
			}
		}

		Util::clear_screen();
		std::cout << "Bye.\n"sv;
		return ExitSuccess;
	} catch (const std::exception& e) {
		std::cerr << "Fatal error: "sv << e.what() << '\n';
		return ExitError;
	}
}
