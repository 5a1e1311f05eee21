#include "backend/CacheStore.hpp"
#include "backend/Config.hpp"
#include "backend/Errors.hpp"
#include "backend/QueryFacade.hpp"
#include "backend/RecordedCatalog.hpp"
#include "backend/RemoteExecutor.hpp"
#include "backend/TokenManager.hpp"
#include "util/JsonUtils.hpp"
#include "util/Logger.hpp"
#include <chrono>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

constexpr int EXIT_USAGE = 2;
constexpr int EXIT_CREDENTIALS = 3;

void print_usage() {
    std::cerr << "usage: minstrel [--config FILE] [--no-store] COMMAND\n"
              << "\n"
              << "commands:\n"
              << "  search TYPE QUERY   TYPE is artist, album or track\n"
              << "  detail TYPE ID      TYPE is artist or album\n"
              << "  track ID            track metadata and audio features\n"
              << "  init-config         write the default config file\n";
}

}  // namespace

int main(int argc, char** argv) {
    using namespace minstrel;

    std::optional<std::filesystem::path> config_path;
    bool no_store = false;
    std::vector<std::string> args;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--no-store") {
            no_store = true;
        } else if (arg == "-h" || arg == "--help") {
            print_usage();
            return 0;
        } else {
            args.push_back(arg);
        }
    }

    if (args.empty()) {
        print_usage();
        return EXIT_USAGE;
    }

    backend::Config config = config_path ? backend::ConfigLoader::load_from_file(*config_path)
                                         : backend::ConfigLoader::load_config();

    util::Logger::init(config.log_file, util::Logger::parse_level(config.log_level));
    util::Logger::info("Minstrel starting...");

    const std::string& command = args[0];
    if (command == "init-config") {
        auto target = config_path.value_or(backend::ConfigLoader::get_config_file());
        if (!backend::ConfigLoader::save_config(config, target)) {
            std::cerr << "minstrel: cannot write " << target.string() << std::endl;
            return 1;
        }
        std::cout << target.string() << std::endl;
        return 0;
    }

    bool valid = (command == "search" && args.size() == 3) ||
                 (command == "detail" && args.size() == 3) ||
                 (command == "track" && args.size() == 2);
    if (!valid) {
        print_usage();
        return EXIT_USAGE;
    }

    try {
        // Declaration order matters: the executor joins its workers before
        // the catalog they reference is destroyed.
        backend::RecordedCatalog catalog(config.catalog_directory);
        backend::RemoteExecutor executor(static_cast<size_t>(config.worker_threads),
                                         static_cast<size_t>(config.queue_limit),
                                         std::chrono::seconds(config.timeout_seconds));
        backend::CacheStore cache(config.cache_directory, config.memoize && !no_store);
        backend::TokenManager tokens(config.resolved_token_file(), config.credentials_file, catalog, executor);
        backend::QueryFacade facade(catalog, cache, tokens, executor);

        Json::Value result;
        if (command == "search") {
            result = facade.search(args[1], args[2]);
        } else if (command == "detail") {
            result = facade.entity_detail(args[1], args[2]);
        } else {
            result = facade.track_detail(args[1]);
        }

        std::cout << util::write_json(result, true) << std::endl;
        return 0;

    } catch (const backend::CredentialsMissing& e) {
        util::Logger::error(std::string("Fatal: ") + e.what());
        std::cerr << "minstrel: " << e.what() << std::endl;
        return EXIT_CREDENTIALS;
    } catch (const backend::MinstrelError& e) {
        util::Logger::error(std::string(backend::to_string(e.kind())) + ": " + e.what());
        std::cerr << "minstrel: " << backend::to_string(e.kind()) << ": " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        util::Logger::error(std::string("Fatal exception: ") + e.what());
        std::cerr << "minstrel: " << e.what() << std::endl;
        return 1;
    }
}
