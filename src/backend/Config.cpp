#include "backend/Config.hpp"
#include "util/Logger.hpp"
#include "util/Platform.hpp"
#include <fstream>
#include <limits>
#include <system_error>
#include <string>

namespace minstrel::backend {

namespace {

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r");
    return s.substr(start, end - start + 1);
}

constexpr int MAX_WORKER_THREADS = 256;

// Keeps the current value when the text is not a number in [min_value, max_value]
void parse_int(const std::string& key, const std::string& value, int& target,
               int min_value = 1, int max_value = std::numeric_limits<int>::max()) {
    int parsed = 0;
    try {
        parsed = std::stoi(value);
    } catch (const std::exception&) {
        util::Logger::warn("Config: Ignoring non-numeric " + key + " = " + value);
        return;
    }

    if (parsed < min_value || parsed > max_value) {
        util::Logger::warn("Config: Ignoring out-of-range " + key + " = " + value + ", keeping " +
                           std::to_string(target));
        return;
    }
    target = parsed;
}

}  // namespace

Config ConfigLoader::load_config() {
    util::Logger::info("Config: Loading configuration");

    auto config_file = get_config_file();
    if (std::filesystem::exists(config_file)) {
        return load_from_file(config_file);
    }
    return create_default_config();
}

Config ConfigLoader::load_from_file(const std::filesystem::path& path) {
    util::Logger::debug("Config: Loading from " + path.string());

    Config cfg = create_default_config();

    std::ifstream file(path);
    if (!file) {
        util::Logger::warn("Config: Cannot open " + path.string() + ", using defaults");
        return cfg;
    }

    std::string line, current_section;
    while (std::getline(file, line)) {
        line = trim(line);

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') continue;

        // Section header
        if (line[0] == '[' && line.back() == ']') {
            current_section = line.substr(1, line.length() - 2);
            continue;
        }

        // Key = value
        auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) continue;

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));

        // Remove quotes from strings
        if (value.length() >= 2 && value.front() == '"' && value.back() == '"') {
            value = value.substr(1, value.length() - 2);
        }

        if (current_section == "cache") {
            if (key == "directory") cfg.cache_directory = value;
            else if (key == "memoize") cfg.memoize = (value == "true");
        }
        else if (current_section == "auth") {
            if (key == "credentials_file") cfg.credentials_file = value;
            else if (key == "token_file") cfg.token_file = value;
        }
        else if (current_section == "remote") {
            if (key == "catalog_directory") cfg.catalog_directory = value;
            else if (key == "timeout_seconds") parse_int(key, value, cfg.timeout_seconds);
            else if (key == "worker_threads") parse_int(key, value, cfg.worker_threads, 1, MAX_WORKER_THREADS);
            else if (key == "queue_limit") parse_int(key, value, cfg.queue_limit);
        }
        else if (current_section == "log") {
            if (key == "file") cfg.log_file = value;
            else if (key == "level") cfg.log_level = value;
        }
    }

    return cfg;
}

bool ConfigLoader::save_config(const Config& cfg, const std::filesystem::path& path) {
    util::Logger::info("Config: Saving configuration");

    if (path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
    }

    std::ofstream file(path);
    if (!file) {
        util::Logger::error("Config: Cannot write " + path.string());
        return false;
    }

    file << "# Minstrel config\n\n";

    file << "[cache]\n";
    file << "# Directory holding one file per cached catalog call\n";
    file << "directory = \"" << cfg.cache_directory.string() << "\"\n";
    file << "# false wipes the cache directory at startup and bypasses it\n";
    file << "memoize = " << (cfg.memoize ? "true" : "false") << "\n\n";

    file << "[auth]\n";
    file << "# JSON file with client_id and client_secret\n";
    file << "credentials_file = \"" << cfg.credentials_file.string() << "\"\n";
    if (!cfg.token_file.empty()) {
        file << "token_file = \"" << cfg.token_file.string() << "\"\n";
    } else {
        file << "# token_file = \"<cache directory>/token.json\"\n";
    }
    file << "\n";

    file << "[remote]\n";
    file << "catalog_directory = \"" << cfg.catalog_directory.string() << "\"\n";
    file << "# Deadline for a single catalog call\n";
    file << "timeout_seconds = " << cfg.timeout_seconds << "\n";
    file << "worker_threads = " << cfg.worker_threads << "\n";
    file << "queue_limit = " << cfg.queue_limit << "\n\n";

    file << "[log]\n";
    file << "file = \"" << cfg.log_file.string() << "\"\n";
    file << "# debug, info, warn, error\n";
    file << "level = \"" << cfg.log_level << "\"\n";

    return static_cast<bool>(file);
}

std::filesystem::path ConfigLoader::get_config_file() {
    return util::Platform::get_config_directory() / "config.toml";
}

Config ConfigLoader::create_default_config() {
    Config cfg;
    cfg.cache_directory = util::Platform::get_cache_directory();
    return cfg;
}

}  // namespace minstrel::backend
