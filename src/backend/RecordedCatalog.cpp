#include "backend/RecordedCatalog.hpp"
#include "backend/Errors.hpp"
#include "backend/ModelDecoder.hpp"
#include "util/Digest.hpp"
#include "util/JsonUtils.hpp"
#include "util/Logger.hpp"
#include "util/Platform.hpp"
#include "util/UnicodeUtils.hpp"
#include <chrono>

namespace minstrel::backend {

namespace {

int64_t unix_now() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

void throw_if_stopped(const std::stop_token& stop, const std::string& what) {
    if (stop.stop_requested()) {
        throw RemoteCallFailure(what + ": cancelled");
    }
}

}  // namespace

RecordedCatalog::RecordedCatalog(std::filesystem::path root) : root_(std::move(root)) {
    util::Logger::info("RecordedCatalog: Serving recordings from " + root_.string());
}

std::vector<model::SearchResult> RecordedCatalog::search(const model::Token& token,
                                                         const std::string& query,
                                                         const std::vector<std::string>& types,
                                                         std::stop_token stop) {
    authorize(token);

    std::vector<model::SearchResult> results;
    for (const auto& type : types) {
        auto relative = std::filesystem::path("search") / util::slugify(type) / (util::slugify(query) + ".json");

        std::error_code ec;
        if (!std::filesystem::exists(root_ / relative, ec)) {
            util::Logger::debug("RecordedCatalog: No recording for " + relative.string() + ", empty page");
            results.push_back({type, model::Model::paging({})});
            continue;
        }

        auto decoded = ModelDecoder::decode_search(fetch(relative, stop));
        for (auto& result : decoded) {
            results.push_back(std::move(result));
        }
    }
    return results;
}

model::Model RecordedCatalog::get_artist(const model::Token& token, const std::string& id, std::stop_token stop) {
    return fetch_model(token, std::filesystem::path("artists") / (checked_id(id) + ".json"), stop);
}

model::Model RecordedCatalog::get_artist_albums(const model::Token& token, const std::string& id,
                                                std::stop_token stop) {
    return fetch_model(token, std::filesystem::path("artists") / checked_id(id) / "albums.json", stop);
}

model::Model RecordedCatalog::get_album(const model::Token& token, const std::string& id, std::stop_token stop) {
    return fetch_model(token, std::filesystem::path("albums") / (checked_id(id) + ".json"), stop);
}

model::Model RecordedCatalog::get_album_tracks(const model::Token& token, const std::string& id,
                                               std::stop_token stop) {
    return fetch_model(token, std::filesystem::path("albums") / checked_id(id) / "tracks.json", stop);
}

model::Model RecordedCatalog::get_track(const model::Token& token, const std::string& id, std::stop_token stop) {
    return fetch_model(token, std::filesystem::path("tracks") / (checked_id(id) + ".json"), stop);
}

model::Model RecordedCatalog::get_track_audio_features(const model::Token& token, const std::string& id,
                                                       std::stop_token stop) {
    return fetch_model(token, std::filesystem::path("audio-features") / (checked_id(id) + ".json"), stop);
}

model::Token RecordedCatalog::request_client_token(const model::Credentials& credentials, std::stop_token stop) {
    throw_if_stopped(stop, "request_client_token");

    if (credentials.client_id.empty() || credentials.client_secret.empty()) {
        throw AuthorizationRejected("invalid_client: empty client credentials");
    }

    model::Token token;
    token.access_token = "rec-" + util::Digest::sha256_hex(credentials.client_id + ":" +
                                                           credentials.client_secret + ":" +
                                                           std::to_string(unix_now())).substr(0, 40);
    token.token_type = "Bearer";
    token.expires_at = unix_now() + TOKEN_LIFETIME_SECONDS;
    return token;
}

void RecordedCatalog::authorize(const model::Token& token) const {
    if (token.access_token.empty() || token.is_expiring(unix_now(), 0)) {
        throw AuthorizationRejected("401 the access token expired");
    }
}

Json::Value RecordedCatalog::fetch(const std::filesystem::path& relative, const std::stop_token& stop) const {
    throw_if_stopped(stop, relative.string());

    auto blob = util::Platform::read_file(root_ / relative);
    if (!blob) {
        throw RemoteCallFailure("404 no recording for " + relative.string());
    }

    throw_if_stopped(stop, relative.string());

    std::string errors;
    auto payload = util::parse_json(*blob, &errors);
    if (!payload) {
        throw MalformedRemoteResult("recording " + relative.string() + " is not JSON: " + errors);
    }
    return *payload;
}

model::Model RecordedCatalog::fetch_model(const model::Token& token, const std::filesystem::path& relative,
                                          const std::stop_token& stop) const {
    authorize(token);
    return ModelDecoder::decode(fetch(relative, stop));
}

std::string RecordedCatalog::checked_id(const std::string& id) {
    if (id.empty() || id.find('/') != std::string::npos || id.find("..") != std::string::npos) {
        throw RemoteCallFailure("400 invalid id '" + id + "'");
    }
    return id;
}

}  // namespace minstrel::backend
