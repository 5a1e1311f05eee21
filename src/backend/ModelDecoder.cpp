#include "backend/ModelDecoder.hpp"
#include "backend/Errors.hpp"
#include <array>

namespace minstrel::backend {

using model::Model;
using model::ModelType;

namespace {

// Attributes that always hold model lists, even when empty
constexpr std::array<std::string_view, 5> MODEL_LIST_KEYS = {"images", "artists", "albums", "tracks", "items"};

bool is_model_list_key(std::string_view key) {
    for (auto k : MODEL_LIST_KEYS) {
        if (k == key) return true;
    }
    return false;
}

bool has(const Json::Value& object, const char* key) {
    return object.isMember(key) && !object[key].isNull();
}

std::optional<int> optional_int(const Json::Value& object, const char* key) {
    if (object[key].isInt()) return object[key].asInt();
    return std::nullopt;
}

}  // namespace

Model ModelDecoder::decode(const Json::Value& payload) {
    if (!payload.isObject()) {
        throw MalformedRemoteResult("catalog payload is not a JSON object");
    }
    return decode_object(payload);
}

std::vector<model::SearchResult> ModelDecoder::decode_search(const Json::Value& payload) {
    if (!payload.isObject()) {
        throw MalformedRemoteResult("search payload is not a JSON object");
    }

    std::vector<model::SearchResult> results;
    for (const auto& key : payload.getMemberNames()) {
        Model paging = decode_value(payload[key], key);
        if (!paging.is<model::Paging>()) {
            throw MalformedRemoteResult("search result '" + key + "' is not a paging object");
        }
        std::string type = key;
        if (!type.empty() && type.back() == 's') {
            type.pop_back();
        }
        results.push_back({std::move(type), std::move(paging)});
    }
    return results;
}

ModelType ModelDecoder::infer_type(const Json::Value& object) {
    if (!object.isObject() || !object["type"].isString()) {
        return ModelType::Unknown;
    }

    const std::string type = object["type"].asString();
    if (type == "artist") {
        bool full = has(object, "popularity") || has(object, "followers") || has(object, "genres");
        return full ? ModelType::FullArtist : ModelType::SimpleArtist;
    }
    if (type == "album") {
        bool full = has(object, "popularity") || has(object, "label") || has(object, "tracks");
        return full ? ModelType::FullAlbum : ModelType::SimpleAlbum;
    }
    if (type == "track") {
        bool full = has(object, "album") || has(object, "popularity");
        return full ? ModelType::FullTrack : ModelType::SimpleTrack;
    }
    if (type == "audio_features") {
        return ModelType::AudioFeatures;
    }
    return ModelType::Unknown;
}

Model ModelDecoder::decode_value(const Json::Value& value, std::string_view key) {
    if (value.isObject()) {
        return decode_object(value);
    }

    if (value.isArray()) {
        bool objects = !value.empty();
        for (const auto& element : value) {
            objects = objects && element.isObject();
        }
        if (objects || (value.empty() && is_model_list_key(key))) {
            std::vector<Model> items;
            items.reserve(value.size());
            for (const auto& element : value) {
                items.push_back(decode_object(element));
            }
            return Model::collection(std::move(items));
        }
    }

    return Model::scalar(value);
}

Model ModelDecoder::decode_object(const Json::Value& object) {
    if (object["items"].isArray() && object["total"].isIntegral()) {
        model::Paging paging;
        for (const auto& element : object["items"]) {
            paging.items.push_back(decode_value(element, "items"));
        }
        paging.total = object["total"].asInt64();
        if (object["next"].isString()) {
            paging.next = object["next"].asString();
        }
        return Model{std::move(paging)};
    }

    if (object["type"].isString()) {
        model::Item item;
        item.model_type = infer_type(object);
        for (const auto& name : object.getMemberNames()) {
            item.attributes.emplace_back(name, decode_value(object[name], name));
        }
        return Model{std::move(item)};
    }

    if (object["url"].isString()) {
        return Model{model::Image{object["url"].asString(), optional_int(object, "width"),
                                  optional_int(object, "height")}};
    }

    return Model::scalar(object);
}

}  // namespace minstrel::backend
