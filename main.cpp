#include "bridge.h"
#include "config.h"
#include "server/bridge_server.h"

#include <getopt.h>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <curl/curl.h>

// Global debug level (0=off, 1-9=increasing verbosity)
// Used by the dout() macro in debug.h for fine-grained debug control
int g_debug_level = 0;

// Running server, stopped from the signal handler
static BridgeServer* g_server = nullptr;

static void print_usage(int, char** argv) {
	printf("\n=== harmony-bridge - Harmony channel proxy for OpenAI-compatible servers ===\n");
	printf("\nUsage:\n");
	printf("	%s [OPTIONS]\n", argv[0]);
	printf("\nOptions:\n");
	printf("	-u, --upstream-url URL  Upstream API base URL (default: http://localhost:1234)\n");
	printf("	--lm-studio-url URL     Alias for --upstream-url\n");
	printf("	--host HOST             Address to bind to (default: 0.0.0.0)\n");
	printf("	-p, --port PORT         Proxy HTTP port (default: 8000)\n");
	printf("	-f, --format FORMAT     Tool call output: xml (tag tree) or json (OpenAI tool_calls)\n");
	printf("	-m, --markers PRESET    Marker spelling: harmony or bracket (default: harmony)\n");
	printf("	--max-block SIZE        Largest channel payload before forced flush (default: 1M, 0 = unlimited)\n");
	printf("	-c, --config FILE       Config file (default: ~/.config/harmony-bridge/config.json)\n");
	printf("	-l, --log-file FILE     Also log to FILE\n");
	printf("	-d, --debug[=N]         Enable debug mode with optional level (1-9, default: 1)\n");
	printf("	--log-analysis          Log suppressed analysis blocks at debug level\n");
	printf("	-v, --version           Show version information\n");
	printf("	-h, --help              Show this help message\n");
	printf("\nEndpoints:\n");
	printf("	POST /v1/chat/completions, /api/v0/chat/completions\n");
	printf("	GET  /v1/models, /api/v0/models, /health, /status\n");
	printf("\n");
}

static void print_banner(const Config& cfg) {
	printf("\n");
	printf("harmony-bridge %s\n", BRIDGE_VERSION);
	printf("  Upstream:  %s\n", cfg.upstream_url.c_str());
	printf("  Proxy:     http://%s:%d\n", cfg.host.c_str(), cfg.port);
	printf("  Format:    %s\n", cfg.format == "xml" ? "xml (tag tree in content)" : "json (OpenAI tool_calls)");
	printf("  Markers:   %s\n", cfg.markers_name.c_str());
	printf("\n");
	fflush(stdout);
}

static void signal_handler(int signal) {
	(void)signal;
	if (g_server) {
		g_server->shutdown();
	}
}

int main(int argc, char** argv) {
	std::string config_file_path;
	std::string log_file;

	// Command-line overrides, applied after the config file is loaded
	struct {
		std::string upstream_url;
		std::string host;
		int port = 0;
		std::string format;
		std::string markers;
		std::string max_block;
		bool log_analysis = false;
	} cli;

	static struct option long_options[] = {
		{"upstream-url", required_argument, 0, 'u'},
		{"lm-studio-url", required_argument, 0, 'u'},
		{"host", required_argument, 0, 1001},
		{"port", required_argument, 0, 'p'},
		{"format", required_argument, 0, 'f'},
		{"markers", required_argument, 0, 'm'},
		{"max-block", required_argument, 0, 1002},
		{"config", required_argument, 0, 'c'},
		{"log-file", required_argument, 0, 'l'},
		{"debug", optional_argument, 0, 'd'},
		{"log-analysis", no_argument, 0, 1003},
		{"version", no_argument, 0, 'v'},
		{"help", no_argument, 0, 'h'},
		{0, 0, 0, 0}
	};

	int opt;
	int option_index = 0;
	while ((opt = getopt_long(argc, argv, "u:p:f:m:c:l:d::vh", long_options, &option_index)) != -1) {
		switch (opt) {
			case 'u':
				cli.upstream_url = optarg;
				break;
			case 1001: // --host
				cli.host = optarg;
				break;
			case 'p':
				cli.port = atoi(optarg);
				if (cli.port <= 0) {
					fprintf(stderr, "Invalid port: %s\n", optarg);
					return 1;
				}
				break;
			case 'f':
				cli.format = optarg;
				break;
			case 'm':
				cli.markers = optarg;
				break;
			case 1002: // --max-block
				cli.max_block = optarg;
				break;
			case 'c':
				config_file_path = optarg;
				break;
			case 'l':
				log_file = optarg;
				break;
			case 'd':
				// Optional debug level (default to 1 if not specified)
				if (optarg) {
					g_debug_level = atoi(optarg);
				} else {
					g_debug_level = 1;
				}
				break;
			case 1003: // --log-analysis
				cli.log_analysis = true;
				break;
			case 'v':
				printf("harmony-bridge version %s\n", BRIDGE_VERSION);
				return 0;
			case 'h':
				print_usage(argc, argv);
				return 0;
			default:
				print_usage(argc, argv);
				return 1;
		}
	}

	Logger& logger = Logger::instance();
	if (g_debug_level) {
		logger.set_log_level(LogLevel::DEBUG);
		LOG_DEBUG("Debug mode enabled (level " + std::to_string(g_debug_level) + ")");
	}

	// Load configuration, then apply command-line overrides
	Config cfg;
	try {
		if (!config_file_path.empty()) {
			cfg.set_config_path(config_file_path);
		}
		cfg.load();

		if (!cli.upstream_url.empty()) cfg.upstream_url = cli.upstream_url;
		if (!cli.host.empty()) cfg.host = cli.host;
		if (cli.port) cfg.port = cli.port;
		if (!cli.format.empty()) cfg.format = cli.format;
		if (!cli.markers.empty()) cfg.set_markers(cli.markers);
		if (!cli.max_block.empty()) cfg.set_max_block_bytes(cli.max_block);
		if (cli.log_analysis) cfg.log_analysis = true;
		if (!log_file.empty()) cfg.log_file = log_file;

		cfg.validate();
	} catch (const ConfigError& e) {
		fprintf(stderr, "Configuration error: %s\n", e.what());
		return 1;
	}

	if (!cfg.log_file.empty()) {
		logger.set_log_file(cfg.log_file);
	}

	curl_global_init(CURL_GLOBAL_DEFAULT);

	int result = 0;
	{
		auto server = std::make_unique<BridgeServer>(cfg);
		g_server = server.get();

		signal(SIGINT, signal_handler);
		signal(SIGTERM, signal_handler);
		// Client disconnects surface as write errors, not signals
		signal(SIGPIPE, SIG_IGN);

		print_banner(cfg);
		result = server->run();

		g_server = nullptr;
	}

	curl_global_cleanup();
	return result;
}
