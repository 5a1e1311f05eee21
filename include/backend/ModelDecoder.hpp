#pragma once

#include "model/Catalog.hpp"
#include <string_view>
#include <vector>
#include <json/json.h>

namespace minstrel::backend {

// Turns catalog JSON payloads into Model trees.
// Schema is inferred from markers in each object (see infer_type); objects
// without identity become Image or Scalar leaves rather than being dropped.
class ModelDecoder {
public:
    // Top-level payload must be an object, else MalformedRemoteResult
    static model::Model decode(const Json::Value& payload);

    // {"artists": <paging>, "tracks": <paging>, ...} -> one result per key
    static std::vector<model::SearchResult> decode_search(const Json::Value& payload);

    static model::ModelType infer_type(const Json::Value& object);

private:
    static model::Model decode_value(const Json::Value& value, std::string_view key);
    static model::Model decode_object(const Json::Value& object);
};

}  // namespace minstrel::backend
