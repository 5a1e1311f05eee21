#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace minstrel::util {

class Platform {
public:
    static std::filesystem::path get_config_directory();
    static std::filesystem::path get_cache_directory();

    // Whole-file read; nullopt if the file is absent or unreadable
    static std::optional<std::string> read_file(const std::filesystem::path& path);

    // Write to a sibling temp file then rename over path, so readers see
    // either the old content or the new content, never a partial file.
    // Does not create the parent directory.
    static bool write_file_atomic(const std::filesystem::path& path, const std::string& data,
                                  std::string* error = nullptr);
};

}  // namespace minstrel::util
