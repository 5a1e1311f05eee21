#include "backend/TokenManager.hpp"
#include "backend/Errors.hpp"
#include "util/JsonUtils.hpp"
#include "util/Logger.hpp"
#include "util/Platform.hpp"
#include <chrono>

namespace minstrel::backend {

namespace {

int64_t unix_now() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

std::string abbreviated(const std::string& access_token) {
    return access_token.substr(0, 8) + "...";
}

constexpr int REFRESH_KEY = 0;

}  // namespace

const char* to_string(TokenState state) {
    switch (state) {
        case TokenState::Missing: return "Missing";
        case TokenState::Corrupt: return "Corrupt";
        case TokenState::Invalid: return "Invalid";
        case TokenState::Loaded: return "Loaded";
        case TokenState::Refreshed: return "Refreshed";
    }
    return "Unknown";
}

TokenManager::TokenManager(std::filesystem::path token_file,
                           std::filesystem::path credentials_file,
                           CatalogService& catalog,
                           RemoteExecutor& executor)
    : token_file_(std::move(token_file)),
      credentials_file_(std::move(credentials_file)),
      catalog_(catalog),
      executor_(executor) {}

TokenState TokenManager::load() {
    std::error_code ec;
    if (!std::filesystem::exists(token_file_, ec)) {
        util::Logger::warn("TokenManager: No token file found at " + token_file_.string() + ", requesting new");
        std::lock_guard<std::mutex> lock(mutex_);
        token_.reset();
        return state_ = TokenState::Missing;
    }

    std::optional<model::Token> token;
    if (auto blob = util::Platform::read_file(token_file_)) {
        std::string errors;
        if (auto json = util::parse_json(*blob, &errors)) {
            token = from_json(*json);
            if (!token) {
                util::Logger::error("TokenManager: Token file does not hold a token, requesting new");
            }
        } else {
            util::Logger::error("TokenManager: " + errors + " reading token, requesting new");
        }
    } else {
        util::Logger::error("TokenManager: Cannot read " + token_file_.string() + ", requesting new");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (!token) {
        token_.reset();
        return state_ = TokenState::Corrupt;
    }

    token_ = token;
    if (token->is_expiring(unix_now())) {
        util::Logger::info("TokenManager: Stored token " + abbreviated(token->access_token) + " has expired");
        return state_ = TokenState::Invalid;
    }

    util::Logger::info("TokenManager: Obtained token " + abbreviated(token->access_token) + " from file");
    return state_ = TokenState::Loaded;
}

model::Token TokenManager::refresh() {
    return acquire(true);
}

model::Token TokenManager::access_token() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (usable_locked(unix_now())) {
            return *token_;
        }
    }
    return acquire(false);
}

model::Token TokenManager::acquire(bool force) {
    return refresh_flight_.run(REFRESH_KEY, [this, force]() -> model::Token {
        if (!force) {
            // Another caller may have finished a refresh while we were queued
            std::lock_guard<std::mutex> lock(mutex_);
            if (usable_locked(unix_now())) {
                return *token_;
            }
        }

        model::Credentials credentials = load_credentials(credentials_file_);

        model::Token token;
        try {
            CatalogService& catalog = catalog_;
            token = executor_.call<model::Token>(
                "request_client_token",
                [&catalog, credentials](std::stop_token stop) {
                    return catalog.request_client_token(credentials, stop);
                });
        } catch (const MinstrelError& e) {
            util::Logger::error(std::string("TokenManager: ") + e.what() + " requesting token");
            throw TokenAcquisitionFailure(std::string("token request failed: ") + e.what());
        }

        if (token.access_token.empty()) {
            util::Logger::error("TokenManager: Catalog issued an empty access token");
            throw TokenAcquisitionFailure("token request returned an empty access token");
        }

        persist(token);

        std::lock_guard<std::mutex> lock(mutex_);
        token_ = token;
        state_ = TokenState::Refreshed;
        util::Logger::info("TokenManager: Refreshed token " + abbreviated(token.access_token));
        return token;
    });
}

bool TokenManager::persist(const model::Token& token) const {
    std::error_code ec;
    auto parent = token_file_.parent_path();
    if (!parent.empty() && !std::filesystem::is_directory(parent, ec)) {
        util::Logger::debug("TokenManager: No directory " + parent.string() + ", token not saved");
        return false;
    }

    std::string error;
    if (!util::Platform::write_file_atomic(token_file_, util::write_json(to_json(token), true), &error)) {
        util::Logger::warn("TokenManager: Token not saved: " + error);
        return false;
    }

    util::Logger::info("TokenManager: Saved token to file");
    return true;
}

void TokenManager::invalidate(const model::Token& rejected) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (token_ && token_->access_token != rejected.access_token) {
        util::Logger::debug("TokenManager: Rejected token " + abbreviated(rejected.access_token) +
                            " already replaced");
        return;
    }
    util::Logger::warn("TokenManager: Token " + abbreviated(rejected.access_token) + " rejected by catalog");
    state_ = TokenState::Invalid;
}

TokenState TokenManager::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::optional<model::Token> TokenManager::current() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return token_;
}

bool TokenManager::usable_locked(int64_t now) const {
    return token_ && state_ != TokenState::Invalid && !token_->is_expiring(now);
}

model::Credentials TokenManager::load_credentials(const std::filesystem::path& path) {
    auto blob = util::Platform::read_file(path);
    if (!blob) {
        util::Logger::error("TokenManager: Credentials not found at " + std::filesystem::absolute(path).string());
        throw CredentialsMissing("credentials not found at " + path.string());
    }

    std::string errors;
    auto json = util::parse_json(*blob, &errors);
    if (!json) {
        util::Logger::error("TokenManager: Credentials file unreadable: " + errors);
        throw CredentialsMissing("credentials file " + path.string() + " is not valid JSON");
    }

    model::Credentials credentials{util::json_string(*json, "client_id"),
                                   util::json_string(*json, "client_secret")};
    if (credentials.client_id.empty() || credentials.client_secret.empty()) {
        util::Logger::error("TokenManager: Credentials file lacks client_id or client_secret");
        throw CredentialsMissing("credentials file " + path.string() + " lacks client_id or client_secret");
    }
    return credentials;
}

Json::Value TokenManager::to_json(const model::Token& token) {
    Json::Value json(Json::objectValue);
    json["access_token"] = token.access_token;
    json["token_type"] = token.token_type;
    json["expires_at"] = Json::Int64(token.expires_at);
    json["refresh_token"] = token.refresh_token ? Json::Value(*token.refresh_token) : Json::Value();
    return json;
}

std::optional<model::Token> TokenManager::from_json(const Json::Value& json) {
    if (!json.isObject()) return std::nullopt;
    if (!json["access_token"].isString() || json["access_token"].asString().empty()) return std::nullopt;
    if (!json["expires_at"].isIntegral()) return std::nullopt;

    model::Token token;
    token.access_token = json["access_token"].asString();
    token.expires_at = json["expires_at"].asInt64();
    token.token_type = util::json_string(json, "token_type", "Bearer");
    if (json["refresh_token"].isString()) {
        token.refresh_token = json["refresh_token"].asString();
    } else if (!json["refresh_token"].isNull()) {
        return std::nullopt;
    }
    return token;
}

}  // namespace minstrel::backend
