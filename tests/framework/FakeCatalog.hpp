#pragma once

#include "backend/CatalogService.hpp"
#include "backend/Errors.hpp"
#include "backend/ModelDecoder.hpp"
#include "util/JsonUtils.hpp"
#include <atomic>
#include <chrono>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <thread>

namespace minstrel::test {

inline Json::Value json_literal(const std::string& text) {
    std::string errors;
    auto value = util::parse_json(text, &errors);
    if (!value) throw std::runtime_error("bad test payload: " + errors);
    return *value;
}

// Catalog payloads in the shape the service returns them

inline Json::Value track_search_payload() {
    return json_literal(R"({"tracks": {"items": [
        {"id": "t1", "type": "track", "name": "Yesterday", "popularity": 80, "duration_ms": 125000,
         "artists": [{"id": "ar1", "type": "artist", "name": "The Beatles"}],
         "album": {"id": "al1", "type": "album", "name": "Help!",
                   "images": [{"url": "https://img/help.jpg", "width": 640, "height": 640}]}},
        {"id": "t2", "type": "track", "name": "Yesterday Once More", "popularity": 60, "duration_ms": 230000,
         "artists": [{"id": "ar2", "type": "artist", "name": "Carpenters"}],
         "album": {"id": "al2", "type": "album", "name": "Now & Then", "images": []}}
    ], "total": 2, "next": null}})");
}

inline Json::Value track_payload() {
    return json_literal(R"({"id": "t1", "type": "track", "name": "Yesterday", "popularity": 80,
        "disc_number": 1, "track_number": 13, "duration_ms": 125000, "explicit": false,
        "artists": [{"id": "ar1", "type": "artist", "name": "The Beatles"}],
        "album": {"id": "al1", "type": "album", "name": "Help!",
                  "images": [{"url": "https://img/help.jpg", "width": 640, "height": 640}]}})");
}

inline Json::Value audio_features_payload() {
    return json_literal(R"({"id": "t1", "type": "audio_features",
        "danceability": 0.332, "energy": 0.179, "valence": 0.315, "tempo": 97.0})");
}

inline Json::Value artist_payload() {
    return json_literal(R"({"id": "ar1", "type": "artist", "name": "The Beatles", "popularity": 90,
        "genres": ["british invasion", "rock"], "followers": {"href": null, "total": 100},
        "images": [{"url": "https://img/beatles.jpg", "width": 320, "height": 320}]})");
}

inline Json::Value artist_albums_payload() {
    return json_literal(R"({"items": [
        {"id": "al1", "type": "album", "name": "Help!", "release_date": "1965-08-06",
         "artists": [{"id": "ar1", "type": "artist", "name": "The Beatles"}],
         "images": [{"url": "https://img/help.jpg"}]},
        {"id": "al3", "type": "album", "name": "Rubber Soul", "release_date": "1965-12-03",
         "artists": [{"id": "ar1", "type": "artist", "name": "The Beatles"}], "images": []}
    ], "total": 2, "next": null})");
}

inline Json::Value album_payload() {
    return json_literal(R"({"id": "al1", "type": "album", "name": "Help!", "popularity": 70,
        "label": "Parlophone", "release_date": "1965-08-06", "total_tracks": 14, "genres": [],
        "artists": [{"id": "ar1", "type": "artist", "name": "The Beatles"}],
        "images": [{"url": "https://img/help.jpg", "width": 640, "height": 640}]})");
}

inline Json::Value album_tracks_payload() {
    return json_literal(R"({"items": [
        {"id": "t0", "type": "track", "name": "Help!", "disc_number": 1, "track_number": 1, "duration_ms": 138000,
         "artists": [{"id": "ar1", "type": "artist", "name": "The Beatles"}]},
        {"id": "t1", "type": "track", "name": "Yesterday", "disc_number": 1, "track_number": 13, "duration_ms": 125000,
         "artists": [{"id": "ar1", "type": "artist", "name": "The Beatles"}]}
    ], "total": 2})");
}

/// In-memory CatalogService that counts calls and can be told to stall,
/// fail or reject tokens.
class FakeCatalog : public backend::CatalogService {
public:
    FakeCatalog() {
        payloads_["search"] = track_search_payload();
        payloads_["track:t1"] = track_payload();
        payloads_["audio_features:t1"] = audio_features_payload();
        payloads_["artist:ar1"] = artist_payload();
        payloads_["artist_albums:ar1"] = artist_albums_payload();
        payloads_["album:al1"] = album_payload();
        payloads_["album_tracks:al1"] = album_tracks_payload();
    }

    std::vector<model::SearchResult> search(const model::Token& token, const std::string& query,
                                            const std::vector<std::string>& types,
                                            std::stop_token stop) override {
        search_calls++;
        authorize(token);
        stall(call_delay_ms, stop, "search");
        {
            std::lock_guard<std::mutex> lock(mutex_);
            last_query_ = query;
        }

        auto results = backend::ModelDecoder::decode_search(payload("search"));
        if (answer_extra_type) {
            results.push_back({"artist", model::Model::paging({})});
        }
        if (answer_as_type) {
            for (auto& result : results) result.type = answer_as_type_name;
        }
        (void)types;
        return results;
    }

    model::Model get_artist(const model::Token& token, const std::string& id, std::stop_token stop) override {
        return entity("artist", token, id, stop);
    }
    model::Model get_artist_albums(const model::Token& token, const std::string& id, std::stop_token stop) override {
        return entity("artist_albums", token, id, stop);
    }
    model::Model get_album(const model::Token& token, const std::string& id, std::stop_token stop) override {
        return entity("album", token, id, stop);
    }
    model::Model get_album_tracks(const model::Token& token, const std::string& id, std::stop_token stop) override {
        return entity("album_tracks", token, id, stop);
    }
    model::Model get_track(const model::Token& token, const std::string& id, std::stop_token stop) override {
        return entity("track", token, id, stop);
    }
    model::Model get_track_audio_features(const model::Token& token, const std::string& id,
                                          std::stop_token stop) override {
        return entity("audio_features", token, id, stop);
    }

    model::Token request_client_token(const model::Credentials& credentials, std::stop_token stop) override {
        int serial = ++token_requests;
        stall(token_delay_ms, stop, "request_client_token");
        if (fail_tokens) {
            throw backend::RemoteCallFailure("503 token endpoint unavailable");
        }
        if (issue_empty_tokens) {
            return model::Token{};
        }

        model::Token token;
        token.access_token = "tok-" + std::to_string(serial) + "-" + credentials.client_id;
        token.expires_at = unix_now() + 3600;
        return token;
    }

    void reject(const std::string& access_token) {
        std::lock_guard<std::mutex> lock(mutex_);
        rejected_.insert(access_token);
    }

    int calls(const std::string& operation) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entity_calls_.find(operation);
        return it == entity_calls_.end() ? 0 : it->second;
    }

    std::string last_query() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_query_;
    }

    static int64_t unix_now() {
        return std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
    }

    std::atomic<int> search_calls{0};
    std::atomic<int> token_requests{0};
    std::atomic<int> call_delay_ms{0};
    std::atomic<int> token_delay_ms{0};
    std::atomic<bool> fail_tokens{false};
    std::atomic<bool> issue_empty_tokens{false};
    std::atomic<bool> answer_extra_type{false};
    std::atomic<bool> answer_as_type{false};
    std::string answer_as_type_name = "album";

private:
    model::Model entity(const std::string& operation, const model::Token& token, const std::string& id,
                        const std::stop_token& stop) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            entity_calls_[operation]++;
        }
        authorize(token);
        stall(call_delay_ms, stop, operation);
        return backend::ModelDecoder::decode(payload(operation + ":" + id));
    }

    Json::Value payload(const std::string& key) const {
        auto it = payloads_.find(key);
        if (it == payloads_.end()) {
            throw backend::RemoteCallFailure("404 " + key);
        }
        return it->second;
    }

    void authorize(const model::Token& token) const {
        std::lock_guard<std::mutex> lock(mutex_);
        if (token.access_token.empty() || rejected_.count(token.access_token)) {
            throw backend::AuthorizationRejected("401 invalid access token");
        }
    }

    static void stall(int delay_ms, const std::stop_token& stop, const std::string& what) {
        auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(delay_ms);
        while (std::chrono::steady_clock::now() < deadline) {
            if (stop.stop_requested()) {
                throw backend::RemoteCallFailure(what + ": cancelled");
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
    }

    mutable std::mutex mutex_;
    std::map<std::string, Json::Value> payloads_;
    std::map<std::string, int> entity_calls_;
    std::set<std::string> rejected_;
    std::string last_query_;
};

} // namespace minstrel::test
