#pragma once

#include <string>

namespace minstrel::util {

class Digest {
public:
    // SHA-256 of data as a 64-char lowercase hex string
    static std::string sha256_hex(const std::string& data);
};

}  // namespace minstrel::util
