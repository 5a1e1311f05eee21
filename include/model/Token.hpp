#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace minstrel::model {

struct Token {
    std::string access_token;
    std::string token_type = "Bearer";
    int64_t expires_at = 0;  // unix seconds
    std::optional<std::string> refresh_token;

    // Treated as unusable once fewer than margin_seconds remain
    bool is_expiring(int64_t now, int64_t margin_seconds = 60) const {
        return expires_at - now < margin_seconds;
    }

    bool operator==(const Token&) const = default;
};

// Operator-supplied client credentials. Read only; never persisted.
struct Credentials {
    std::string client_id;
    std::string client_secret;
};

}  // namespace minstrel::model
