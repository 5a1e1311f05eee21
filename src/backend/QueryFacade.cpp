#include "backend/QueryFacade.hpp"
#include "backend/Errors.hpp"
#include "util/Logger.hpp"

namespace minstrel::backend {

namespace {

bool is_search_type(const std::string& type) {
    return type == "artist" || type == "album" || type == "track";
}

}  // namespace

QueryFacade::QueryFacade(CatalogService& catalog, CacheStore& cache, TokenManager& tokens,
                         RemoteExecutor& executor)
    : catalog_(catalog), cache_(cache), tokens_(tokens), executor_(executor) {
    TokenState state = tokens_.load();
    if (state == TokenState::Loaded) {
        return;
    }

    util::Logger::info(std::string("QueryFacade: Token ") + to_string(state) + ", requesting a new one");
    try {
        tokens_.refresh();
    } catch (const TokenAcquisitionFailure& e) {
        util::Logger::error(std::string("QueryFacade: Starting without a token: ") + e.what());
    }
}

Json::Value QueryFacade::search(const std::string& entity_type, const std::string& query) {
    util::Logger::info("QueryFacade: search " + entity_type + " '" + query + "'");
    if (!is_search_type(entity_type)) {
        throw InvalidRequest("cannot search for '" + entity_type + "'");
    }

    // The catalog answers a search with one paging per type, so the remote
    // step unwraps the single expected page before the view sees it.
    RemoteFn remote = [entity_type, query](CatalogService& catalog, const model::Token& token,
                                           std::stop_token stop) {
        auto results = catalog.search(token, query, {entity_type}, stop);
        if (results.size() != 1) {
            throw UnsupportedModel("search for " + entity_type + " returned " +
                                   std::to_string(results.size()) + " result types");
        }
        if (results.front().type != entity_type) {
            throw UnsupportedModel("search for " + entity_type + " returned " + results.front().type +
                                   " results");
        }
        return std::move(results.front().paging);
    };

    return cached_call("search", {{"query", query}, {"types", entity_type}}, std::move(remote),
                       [this](const model::Model& paging) { return views_.search_view(paging); });
}

Json::Value QueryFacade::entity_detail(const std::string& entity_type, const std::string& id) {
    util::Logger::info("QueryFacade: detail " + entity_type + " " + id);

    auto detail = [this](const model::Model& m) { return views_.detail_view(m); };
    auto listing = [this](const model::Model& m) { return views_.search_view(m); };

    Json::Value result(Json::objectValue);
    if (entity_type == "artist") {
        result["primary"] = cached_call("artist", {{"artist_id", id}},
            [id](CatalogService& c, const model::Token& t, std::stop_token s) { return c.get_artist(t, id, s); },
            detail);
        result["related"] = cached_call("artist_albums", {{"artist_id", id}},
            [id](CatalogService& c, const model::Token& t, std::stop_token s) { return c.get_artist_albums(t, id, s); },
            listing);
    } else if (entity_type == "album") {
        result["primary"] = cached_call("album", {{"album_id", id}},
            [id](CatalogService& c, const model::Token& t, std::stop_token s) { return c.get_album(t, id, s); },
            detail);
        result["related"] = cached_call("album_tracks", {{"album_id", id}},
            [id](CatalogService& c, const model::Token& t, std::stop_token s) { return c.get_album_tracks(t, id, s); },
            listing);
    } else {
        throw InvalidRequest("no detail page for '" + entity_type + "'");
    }
    return result;
}

Json::Value QueryFacade::track_detail(const std::string& id) {
    util::Logger::info("QueryFacade: track " + id);

    auto detail = [this](const model::Model& m) { return views_.detail_view(m); };

    Json::Value result(Json::objectValue);
    result["track"] = cached_call("track", {{"track_id", id}},
        [id](CatalogService& c, const model::Token& t, std::stop_token s) { return c.get_track(t, id, s); },
        detail);
    result["audio"] = cached_call("track_audio_features", {{"track_id", id}},
        [id](CatalogService& c, const model::Token& t, std::stop_token s) {
            return c.get_track_audio_features(t, id, s);
        },
        detail);
    return result;
}

Json::Value QueryFacade::cached_call(const std::string& operation, const NamedParams& params,
                                     RemoteFn remote, const ViewFn& view) {
    CallSignature signature(operation, params);
    return cache_.get_or_compute(signature, [&]() {
        return view(call_remote(operation, remote));
    });
}

model::Model QueryFacade::call_remote(const std::string& operation, const RemoteFn& remote) {
    auto attempt = [&](const model::Token& token) {
        CatalogService& catalog = catalog_;
        return executor_.call<model::Model>(operation, [&catalog, remote, token](std::stop_token stop) {
            return remote(catalog, token, stop);
        });
    };

    model::Token token = tokens_.access_token();
    try {
        return attempt(token);
    } catch (const AuthorizationRejected& e) {
        // One retry with a fresh token; any other failure goes straight to the caller
        util::Logger::warn("QueryFacade: " + operation + " rejected (" + e.what() + "), refreshing token");
        tokens_.invalidate(token);
        return attempt(tokens_.access_token());
    }
}

}  // namespace minstrel::backend
