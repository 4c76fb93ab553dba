#ifndef APPLICATION_H
#define APPLICATION_H

#include "api_gateway.h"
#include "config.h"
#include "display_manager.h"
#include "downloader.h"
#include "http_client.h"
#include "input_handler.h"
#include "navigator.h"

#include <istream>
#include <string>

// ============================================================================
// Application
// ============================================================================

class Application {
	CurlTransport transport_;
	ModrinthGateway gateway_;
	Downloader downloader_;
	DisplayManager display_;
	Navigator navigator_;
	InputHandler input_;

	ScreenPtr screen_ = {};

public:
	Application(const Config& config, std::istream& in);

	// Runs until the user quits. A non-empty query is searched right away.
	[[nodiscard]] int run(const std::string& initial_query = "");
};

#endif
