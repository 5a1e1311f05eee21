#include "util/Platform.hpp"
#include "util/Logger.hpp"
#include <atomic>
#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <sstream>
#include <unistd.h>

namespace minstrel::util {

std::filesystem::path Platform::get_config_directory() {
    auto home = std::getenv("HOME");
    if (home) {
        return std::filesystem::path(home) / ".config" / "minstrel";
    }
    Logger::warn("Platform: HOME env var not set, using fallback: .config/minstrel");
    return ".config/minstrel";
}

std::filesystem::path Platform::get_cache_directory() {
    auto home = std::getenv("HOME");
    if (home) {
        return std::filesystem::path(home) / ".cache" / "minstrel";
    }
    Logger::warn("Platform: HOME env var not set, using fallback: .cache/minstrel");
    return ".cache/minstrel";
}

std::optional<std::string> Platform::read_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return std::nullopt;
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        return std::nullopt;
    }
    return buffer.str();
}

bool Platform::write_file_atomic(const std::filesystem::path& path, const std::string& data,
                                 std::string* error) {
    static std::atomic<uint64_t> sequence{0};

    auto temp = path;
    temp += ".tmp." + std::to_string(::getpid()) + "." + std::to_string(sequence.fetch_add(1));

    {
        std::ofstream out(temp, std::ios::binary | std::ios::trunc);
        if (!out) {
            if (error) *error = "cannot open " + temp.string() + ": " + std::strerror(errno);
            return false;
        }
        out.write(data.data(), static_cast<std::streamsize>(data.size()));
        out.flush();
        if (!out) {
            if (error) *error = "short write to " + temp.string();
            out.close();
            std::error_code ec;
            std::filesystem::remove(temp, ec);
            return false;
        }
    }

    if (std::rename(temp.c_str(), path.c_str()) != 0) {
        if (error) *error = "rename to " + path.string() + " failed: " + std::strerror(errno);
        std::error_code ec;
        std::filesystem::remove(temp, ec);
        return false;
    }
    return true;
}

}  // namespace minstrel::util
