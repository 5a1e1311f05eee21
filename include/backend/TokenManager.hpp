#pragma once

#include "backend/CatalogService.hpp"
#include "backend/RemoteExecutor.hpp"
#include "model/Token.hpp"
#include "util/SingleFlight.hpp"
#include <filesystem>
#include <mutex>
#include <optional>
#include <json/json.h>

namespace minstrel::backend {

enum class TokenState {
    Missing,    // no token file
    Corrupt,    // file unreadable or not a token
    Invalid,    // well-formed but expiring, or rejected by the service
    Loaded,     // restored from the previous session
    Refreshed,  // freshly issued this session
};

const char* to_string(TokenState state);

/**
 * Owns the access token shared by every remote call.
 *
 * The token is restored from token_file at startup and replaced through the
 * catalog's client-credentials grant when it is missing, corrupt or no longer
 * usable. A new token is written to disk before any caller sees it. Only one
 * credential request is in flight at a time; concurrent callers wait for it.
 */
class TokenManager {
public:
    TokenManager(std::filesystem::path token_file,
                 std::filesystem::path credentials_file,
                 CatalogService& catalog,
                 RemoteExecutor& executor);

    // Never throws; the resulting state says what happened
    TokenState load();

    // Throws CredentialsMissing or TokenAcquisitionFailure
    model::Token refresh();

    // False (and logged) when the token could not be written
    bool persist(const model::Token& token) const;

    // Current token, refreshed first if it is not usable
    model::Token access_token();

    // Mark rejected as unusable so the next access refreshes it. A no-op when
    // the current token has already been replaced by a newer one.
    void invalidate(const model::Token& rejected);

    TokenState state() const;
    std::optional<model::Token> current() const;
    const std::filesystem::path& token_file() const { return token_file_; }

    // Throws CredentialsMissing when the file is absent or lacks either field
    static model::Credentials load_credentials(const std::filesystem::path& path);

    static Json::Value to_json(const model::Token& token);
    static std::optional<model::Token> from_json(const Json::Value& json);

private:
    model::Token acquire(bool force);
    bool usable_locked(int64_t now) const;

    std::filesystem::path token_file_;
    std::filesystem::path credentials_file_;
    CatalogService& catalog_;
    RemoteExecutor& executor_;

    mutable std::mutex mutex_;
    std::optional<model::Token> token_;
    TokenState state_ = TokenState::Missing;

    util::SingleFlight<int, model::Token> refresh_flight_;
};

}  // namespace minstrel::backend
