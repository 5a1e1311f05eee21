#pragma once

#include "backend/CatalogService.hpp"
#include <filesystem>
#include <json/json.h>

namespace minstrel::backend {

/**
 * CatalogService answering from catalog responses recorded on disk.
 *
 * Layout under root:
 *   search/<type>/<slug(query)>.json
 *   artists/<id>.json      artists/<id>/albums.json
 *   albums/<id>.json       albums/<id>/tracks.json
 *   tracks/<id>.json       audio-features/<id>.json
 *
 * A search with no recording yields an empty page; any other missing
 * recording is reported like the service's 404.
 */
class RecordedCatalog : public CatalogService {
public:
    explicit RecordedCatalog(std::filesystem::path root);

    std::vector<model::SearchResult> search(const model::Token& token,
                                            const std::string& query,
                                            const std::vector<std::string>& types,
                                            std::stop_token stop) override;

    model::Model get_artist(const model::Token& token, const std::string& id, std::stop_token stop) override;
    model::Model get_artist_albums(const model::Token& token, const std::string& id, std::stop_token stop) override;
    model::Model get_album(const model::Token& token, const std::string& id, std::stop_token stop) override;
    model::Model get_album_tracks(const model::Token& token, const std::string& id, std::stop_token stop) override;
    model::Model get_track(const model::Token& token, const std::string& id, std::stop_token stop) override;
    model::Model get_track_audio_features(const model::Token& token, const std::string& id,
                                          std::stop_token stop) override;

    model::Token request_client_token(const model::Credentials& credentials, std::stop_token stop) override;

    static constexpr int64_t TOKEN_LIFETIME_SECONDS = 3600;

private:
    void authorize(const model::Token& token) const;
    Json::Value fetch(const std::filesystem::path& relative, const std::stop_token& stop) const;
    model::Model fetch_model(const model::Token& token, const std::filesystem::path& relative,
                             const std::stop_token& stop) const;
    static std::string checked_id(const std::string& id);

    std::filesystem::path root_;
};

}  // namespace minstrel::backend
