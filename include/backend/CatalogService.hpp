#pragma once

#include "model/Catalog.hpp"
#include "model/Token.hpp"
#include <stop_token>
#include <string>
#include <vector>

namespace minstrel::backend {

/**
 * Remote catalog collaborator.
 *
 * Implementations own transport and payload decoding. Every call may block
 * on I/O and should poll the stop_token between steps; it is signalled when
 * the caller's deadline passes. Failures are reported as RemoteCallFailure
 * (AuthorizationRejected when the token is refused) or MalformedRemoteResult.
 */
class CatalogService {
public:
    virtual ~CatalogService() = default;

    // One SearchResult per type the service answered for
    virtual std::vector<model::SearchResult> search(const model::Token& token,
                                                    const std::string& query,
                                                    const std::vector<std::string>& types,
                                                    std::stop_token stop) = 0;

    virtual model::Model get_artist(const model::Token& token, const std::string& id, std::stop_token stop) = 0;
    virtual model::Model get_artist_albums(const model::Token& token, const std::string& id, std::stop_token stop) = 0;
    virtual model::Model get_album(const model::Token& token, const std::string& id, std::stop_token stop) = 0;
    virtual model::Model get_album_tracks(const model::Token& token, const std::string& id, std::stop_token stop) = 0;
    virtual model::Model get_track(const model::Token& token, const std::string& id, std::stop_token stop) = 0;
    virtual model::Model get_track_audio_features(const model::Token& token, const std::string& id,
                                                  std::stop_token stop) = 0;

    virtual model::Token request_client_token(const model::Credentials& credentials, std::stop_token stop) = 0;
};

}  // namespace minstrel::backend
