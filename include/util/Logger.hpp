#pragma once

#include <filesystem>
#include <string>

namespace minstrel::util {

class Logger {
public:
    enum class Level { Debug, Info, Warn, Error };

    static void init(const std::filesystem::path& file, Level min_level = Level::Info);
    static void set_level(Level min_level);
    static Level parse_level(const std::string& name, Level fallback = Level::Info);

    static void log(Level level, const std::string& message);
    static void debug(const std::string& message);
    static void info(const std::string& message);
    static void warn(const std::string& message);
    static void error(const std::string& message);
};

}  // namespace minstrel::util
