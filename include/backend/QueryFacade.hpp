#pragma once

#include "backend/CacheStore.hpp"
#include "backend/CatalogService.hpp"
#include "backend/RemoteExecutor.hpp"
#include "backend/TokenManager.hpp"
#include "backend/ViewBuilder.hpp"
#include <functional>
#include <string>
#include <json/json.h>

namespace minstrel::backend {

/**
 * The three read operations the HTTP layer consumes.
 *
 *   search("track", "Yesterday")   -> [search record, ...]
 *   entity_detail("artist", id)    -> {"primary": detail, "related": [album records]}
 *   entity_detail("album", id)     -> {"primary": detail, "related": [track records]}
 *   track_detail(id)               -> {"track": detail, "audio": audio features}
 *
 * Each remote call goes through cached_call(), so repeated requests are
 * served from the CacheStore without touching the catalog.
 *
 * Construction restores or acquires the access token. CredentialsMissing
 * escapes the constructor; a failed token request is logged and retried on
 * the first call that needs a token.
 */
class QueryFacade {
public:
    QueryFacade(CatalogService& catalog, CacheStore& cache, TokenManager& tokens, RemoteExecutor& executor);

    Json::Value search(const std::string& entity_type, const std::string& query);
    Json::Value entity_detail(const std::string& entity_type, const std::string& id);
    Json::Value track_detail(const std::string& id);

    using RemoteFn = std::function<model::Model(CatalogService&, const model::Token&, std::stop_token)>;
    using ViewFn = std::function<Json::Value(const model::Model&)>;

    // Cache lookup, then on a miss: token, remote call (deadline-bound),
    // view transform, store. Only operation and params form the cache key.
    Json::Value cached_call(const std::string& operation, const NamedParams& params,
                            RemoteFn remote, const ViewFn& view);

private:
    model::Model call_remote(const std::string& operation, const RemoteFn& remote);

    CatalogService& catalog_;
    CacheStore& cache_;
    TokenManager& tokens_;
    RemoteExecutor& executor_;
    ViewBuilder views_;
};

}  // namespace minstrel::backend
