#include <iostream>
#include <memory>
#include <string>

#include <cxxopts.hpp>
#include <glog/logging.h>

#include "common/configuration.h"
#include "orchestrator/orchestrator.h"
#include "remote_client/curl_transport.h"

int main(int argc, char* argv[]) {
	google::InitGoogleLogging(argv[0]);
	google::InstallFailureSignalHandler();

	cxxopts::Options options("rxcache_build", "Build the RxNav response cache with parallel fetchers");
	options.add_options()
		("config", "YAML configuration file", cxxopts::value<std::string>())
		("cache", "Cache file path", cxxopts::value<std::string>())
		("w,workers", "Number of worker processes per phase", cxxopts::value<int>())
		("log_dir", "Directory for per-process log files", cxxopts::value<std::string>())
		("fail_if_not_cached", "Never call the remote service, fail on a cache miss")
		("base_url", "RxNav REST base URL", cxxopts::value<std::string>())
		("socket", "Cache writer socket path", cxxopts::value<std::string>())
		("l,log_level", "Log level", cxxopts::value<int>()->default_value("0"))
		("h,help", "Print usage");

	std::unique_ptr<cxxopts::ParseResult> parsed;
	try {
		parsed = std::make_unique<cxxopts::ParseResult>(options.parse(argc, argv));
	} catch (const std::exception& e) {
		LOG(ERROR) << "Invalid arguments: " << e.what();
		return EXIT_FAILURE;
	}
	const cxxopts::ParseResult& arguments = *parsed;
	if (arguments.count("help")) {
		std::cout << options.help() << std::endl;
		return EXIT_SUCCESS;
	}

	FLAGS_v = arguments["log_level"].as<int>();
	FLAGS_logtostderr = 1;

	Rxcache::Configuration& configuration = Rxcache::Configuration::getInstance();
	if (arguments.count("config")) {
		const std::string path = arguments["config"].as<std::string>();
		if (!configuration.loadFromFile(path)) {
			LOG(ERROR) << "Failed to load configuration from " << path;
			for (const auto& error : configuration.getValidationErrors()) {
				LOG(ERROR) << "  " << error;
			}
			return EXIT_FAILURE;
		}
	}

	// Command line beats file and defaults
	Rxcache::RxcacheConfig& config = configuration.config();
	if (arguments.count("cache")) config.cache.path.set(arguments["cache"].as<std::string>());
	if (arguments.count("workers")) config.build.workers.set(arguments["workers"].as<int>());
	if (arguments.count("log_dir")) config.build.log_dir.set(arguments["log_dir"].as<std::string>());
	if (arguments.count("fail_if_not_cached")) config.build.fail_if_not_cached.set(true);
	if (arguments.count("base_url")) config.remote.base_url.set(arguments["base_url"].as<std::string>());
	if (arguments.count("socket")) config.channel.socket_path.set(arguments["socket"].as<std::string>());

	if (!configuration.validate()) {
		for (const auto& error : configuration.getValidationErrors()) {
			LOG(ERROR) << "Configuration error: " << error;
		}
		return EXIT_FAILURE;
	}

	Rxcache::InitCurlGlobal();

	Rxcache::CurlTransportOptions transport_options;
	transport_options.connect_timeout_s = config.remote.connect_timeout_s.get();
	transport_options.request_timeout_s = config.remote.request_timeout_s.get();

	Rxcache::Orchestrator orchestrator(Rxcache::BuildOptions::FromConfig(config),
			[transport_options]() -> std::unique_ptr<Rxcache::RemoteTransport> {
				return std::make_unique<Rxcache::CurlTransport>(transport_options);
			});
	int rc = orchestrator.Run();

	Rxcache::CleanupCurlGlobal();
	return rc == 0 ? EXIT_SUCCESS : EXIT_FAILURE;
}
