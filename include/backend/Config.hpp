#pragma once

#include <filesystem>
#include <string>

namespace minstrel::backend {

struct Config {
    // Cache settings
    std::filesystem::path cache_directory;
    bool memoize = true;

    // Authentication
    std::filesystem::path credentials_file = "credentials.json";
    std::filesystem::path token_file;  // empty: <cache_directory>/token.json

    // Remote catalog
    std::filesystem::path catalog_directory = "recordings";
    int timeout_seconds = 30;
    int worker_threads = 4;
    int queue_limit = 64;

    // Logging
    std::filesystem::path log_file = "/tmp/minstrel.log";
    std::string log_level = "info";

    std::filesystem::path resolved_token_file() const {
        return token_file.empty() ? cache_directory / "token.json" : token_file;
    }
};

class ConfigLoader {
public:
    static Config load_config();
    static Config load_from_file(const std::filesystem::path& path);
    static bool save_config(const Config& cfg, const std::filesystem::path& path);

    static std::filesystem::path get_config_file();

private:
    static Config create_default_config();
};

}  // namespace minstrel::backend
