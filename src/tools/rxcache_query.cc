#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <cxxopts.hpp>
#include <glog/logging.h>

#include "absl/strings/numbers.h"
#include "absl/strings/str_join.h"
#include "absl/strings/str_split.h"

#include "common/configuration.h"
#include "common/errors.h"
#include "common/overloaded.h"
#include "remote_client/cache_query_service.h"

namespace {

int64_t ParseCodeArgument(const std::string& text) {
	int64_t code;
	if (!absl::SimpleAtoi(text, &code)) {
		throw std::invalid_argument("Not a code: [" + text + "]");
	}
	return code;
}

void PrintHistoryValue(const Rxcache::HistoryValue& value) {
	std::visit(Rxcache::Overloaded{
			[](const std::string& s) { std::cout << s; },
			[](const std::optional<int64_t>& code) {
				if (code) std::cout << *code; else std::cout << "None";
			},
			[](const std::vector<int64_t>& codes) {
				std::cout << "[" << absl::StrJoin(codes, ", ") << "]";
			},
		}, value);
}

int RunQuery(const cxxopts::ParseResult& arguments, Rxcache::CacheQueryService& service) {
	Json::StreamWriterBuilder json_writer;
	json_writer["indentation"] = "  ";

	if (arguments.count("key")) {
		std::cout << service.Lookup(arguments["key"].as<std::string>()) << std::endl;
		return EXIT_SUCCESS;
	}
	if (arguments.count("history")) {
		int64_t code = ParseCodeArgument(arguments["history"].as<std::string>());
		std::vector<Rxcache::HistoryField> fields;
		for (absl::string_view name : absl::StrSplit(arguments["fields"].as<std::string>(), ',',
					absl::SkipWhitespace())) {
			fields.push_back(Rxcache::ParseHistoryField(std::string(name)));
		}
		auto values = service.HistoricalAttributes(code, fields);
		if (!values) {
			std::cout << "None" << std::endl;
			return EXIT_SUCCESS;
		}
		for (size_t i = 0; i < fields.size(); ++i) {
			std::cout << Rxcache::HistoryFieldName(fields[i]) << "\t";
			PrintHistoryValue((*values)[i]);
			std::cout << std::endl;
		}
		return EXIT_SUCCESS;
	}
	if (arguments.count("related")) {
		int64_t code = ParseCodeArgument(arguments["related"].as<std::string>());
		std::cout << Json::writeString(json_writer, service.AllRelated(code)) << std::endl;
		return EXIT_SUCCESS;
	}
	if (arguments.count("ndc")) {
		int64_t code = ParseCodeArgument(arguments["ndc"].as<std::string>());
		for (const auto& ndc : service.NdcCodesFor(code)) {
			std::cout << ndc << std::endl;
		}
		return EXIT_SUCCESS;
	}
	if (arguments.count("class_tree")) {
		std::cout << Json::writeString(json_writer,
				service.ClassTree(arguments["class_tree"].as<std::string>())) << std::endl;
		return EXIT_SUCCESS;
	}
	if (arguments.count("va_members")) {
		auto codes = service.GenericDrugsForVaClass(arguments["va_members"].as<std::string>());
		std::cout << absl::StrJoin(codes, "\n") << std::endl;
		return EXIT_SUCCESS;
	}
	LOG(ERROR) << "Nothing to query: give one of --key, --history, --related, --ndc, --class_tree, --va_members";
	return EXIT_FAILURE;
}

} // namespace

int main(int argc, char* argv[]) {
	google::InitGoogleLogging(argv[0]);
	google::InstallFailureSignalHandler();

	cxxopts::Options options("rxcache_query", "Read RxNav responses from a built cache");
	options.add_options()
		("config", "YAML configuration file", cxxopts::value<std::string>())
		("cache", "Cache file path", cxxopts::value<std::string>())
		("base_url", "RxNav REST base URL used in request keys", cxxopts::value<std::string>())
		("key", "Print the cached payload for a request key", cxxopts::value<std::string>())
		("history", "Historical attributes of a code", cxxopts::value<std::string>())
		("fields", "Attributes for --history",
		 cxxopts::value<std::string>()->default_value("NAME,TTY,STATUS"))
		("related", "allrelated document of a code", cxxopts::value<std::string>())
		("ndc", "Historical NDCs of a drug code", cxxopts::value<std::string>())
		("class_tree", "Class tree rooted at a class id", cxxopts::value<std::string>())
		("va_members", "Generic drugs of a VA class", cxxopts::value<std::string>())
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
	if (arguments.count("config") && !configuration.loadFromFile(arguments["config"].as<std::string>())) {
		for (const auto& error : configuration.getValidationErrors()) {
			LOG(ERROR) << "Configuration error: " << error;
		}
		return EXIT_FAILURE;
	}
	Rxcache::RxcacheConfig& config = configuration.config();
	if (arguments.count("cache")) config.cache.path.set(arguments["cache"].as<std::string>());
	if (arguments.count("base_url")) config.remote.base_url.set(arguments["base_url"].as<std::string>());

	try {
		auto service = Rxcache::CacheQueryService::Open(config.cache.path.get(), config.remote.base_url.get());
		return RunQuery(arguments, *service);
	} catch (const Rxcache::NotCached& e) {
		LOG(ERROR) << e.what();
		return 2;
	} catch (const std::exception& e) {
		LOG(ERROR) << e.what();
		return EXIT_FAILURE;
	}
}
