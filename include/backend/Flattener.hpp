#pragma once

#include "model/Catalog.hpp"
#include <json/json.h>

namespace minstrel::backend {

// Reduces a nested catalog value to JSON, dispatching on the variant:
//   Paging     -> array of flattened items, source order
//   Collection -> first item flattened, null when empty
//   Image      -> url
//   Item       -> {id, type, name}; id required (MalformedRemoteResult)
//   Scalar     -> stored JSON as-is
class Flattener {
public:
    static Json::Value flatten(const model::Model& model);
    static Json::Value reference(const model::Item& item);
};

}  // namespace minstrel::backend
