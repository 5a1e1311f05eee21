#include "../framework/SimpleTest.hpp"
#include "backend/Config.hpp"
#include "util/Logger.hpp"
#include <fstream>

using namespace minstrel::backend;
using minstrel::test::TempDir;

TEST_CASE(test_config_sections) {
    TempDir dir("config");
    auto path = dir.path() / "config.toml";
    {
        std::ofstream out(path);
        out << "# comment\n"
            << "[cache]\n"
            << "directory = \"/var/cache/minstrel\"\n"
            << "memoize = false\n"
            << "\n"
            << "[auth]\n"
            << "credentials_file = \"/etc/minstrel/credentials.json\"\n"
            << "token_file = \"/var/lib/minstrel/token.json\"\n"
            << "[remote]\n"
            << "catalog_directory = \"/srv/recordings\"\n"
            << "timeout_seconds = 5\n"
            << "worker_threads = 8\n"
            << "[log]\n"
            << "level = \"debug\"\n";
    }

    Config cfg = ConfigLoader::load_from_file(path);
    ASSERT_EQ(cfg.cache_directory, std::filesystem::path("/var/cache/minstrel"));
    ASSERT_FALSE(cfg.memoize);
    ASSERT_EQ(cfg.credentials_file, std::filesystem::path("/etc/minstrel/credentials.json"));
    ASSERT_EQ(cfg.resolved_token_file(), std::filesystem::path("/var/lib/minstrel/token.json"));
    ASSERT_EQ(cfg.catalog_directory, std::filesystem::path("/srv/recordings"));
    ASSERT_EQ(cfg.timeout_seconds, 5);
    ASSERT_EQ(cfg.worker_threads, 8);
    ASSERT_EQ(cfg.queue_limit, 64);
    ASSERT_EQ(cfg.log_level, "debug");
}

TEST_CASE(test_config_bad_number_keeps_default) {
    TempDir dir("config");
    auto path = dir.path() / "config.toml";
    {
        std::ofstream out(path);
        out << "[remote]\ntimeout_seconds = soon\n";
    }

    Config cfg = ConfigLoader::load_from_file(path);
    ASSERT_EQ(cfg.timeout_seconds, 30);
    ASSERT_TRUE(cfg.memoize);

    {
        std::ofstream out(path, std::ios::trunc);
        out << "[remote]\n"
            << "timeout_seconds = 0\n"
            << "worker_threads = -1\n"
            << "queue_limit = 0\n";
    }
    cfg = ConfigLoader::load_from_file(path);
    ASSERT_EQ(cfg.timeout_seconds, 30);
    ASSERT_EQ(cfg.worker_threads, 4);
    ASSERT_EQ(cfg.queue_limit, 64);

    {
        std::ofstream out(path, std::ios::trunc);
        out << "[remote]\n"
            << "timeout_seconds = -5\n"
            << "worker_threads = 100000\n"
            << "queue_limit = 1\n";
    }
    cfg = ConfigLoader::load_from_file(path);
    ASSERT_EQ(cfg.timeout_seconds, 30);
    ASSERT_EQ(cfg.worker_threads, 4);
    ASSERT_EQ(cfg.queue_limit, 1);
}

TEST_CASE(test_token_file_defaults_to_cache_directory) {
    Config cfg;
    cfg.cache_directory = "/tmp/somewhere";
    ASSERT_EQ(cfg.resolved_token_file(), std::filesystem::path("/tmp/somewhere/token.json"));
}

TEST_CASE(test_config_save_and_reload) {
    TempDir dir("config");
    Config cfg;
    cfg.cache_directory = dir.path() / "cache";
    cfg.memoize = false;
    cfg.timeout_seconds = 12;
    cfg.log_level = "warn";

    auto path = dir.path() / "nested" / "config.toml";
    ASSERT_TRUE(ConfigLoader::save_config(cfg, path));

    Config loaded = ConfigLoader::load_from_file(path);
    ASSERT_EQ(loaded.cache_directory, cfg.cache_directory);
    ASSERT_FALSE(loaded.memoize);
    ASSERT_EQ(loaded.timeout_seconds, 12);
    ASSERT_TRUE(loaded.token_file.empty());
    ASSERT_EQ(loaded.log_level, "warn");
}

TEST_CASE(test_log_level_names) {
    using minstrel::util::Logger;
    ASSERT_TRUE(Logger::parse_level("debug") == Logger::Level::Debug);
    ASSERT_TRUE(Logger::parse_level("warning") == Logger::Level::Warn);
    ASSERT_TRUE(Logger::parse_level("loud", Logger::Level::Error) == Logger::Level::Error);
}

int main() {
    return minstrel::test::TestRunner::instance().run_all();
}
