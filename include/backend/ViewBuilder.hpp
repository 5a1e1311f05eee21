#pragma once

#include "model/Catalog.hpp"
#include <map>
#include <string>
#include <utility>
#include <vector>
#include <json/json.h>

namespace minstrel::backend {

enum class View { Search, Detail };

struct AllowList {
    std::vector<std::string> fields;
    std::vector<std::string> required;  // must be present and non-null
};

/**
 * Builds the two output shapes from catalog models.
 *
 * search view: a Paging becomes an array of summary records, one per item.
 * detail view: a single Item becomes one richer record.
 *
 * Which fields a record carries is fixed by the allow-list table keyed by
 * (view, model type). A model type without an entry for the requested view
 * is an UnsupportedModel error, never an empty record. Every listed field is
 * passed through Flattener; listed fields the item lacks come out as null.
 */
class ViewBuilder {
public:
    ViewBuilder();

    Json::Value search_view(const model::Model& model) const;
    Json::Value search_record(const model::Item& item) const;
    Json::Value detail_view(const model::Model& model) const;

    const AllowList* allow_list(View view, model::ModelType type) const;

private:
    Json::Value record(View view, const model::Item& item) const;

    std::map<std::pair<View, model::ModelType>, AllowList> table_;
};

}  // namespace minstrel::backend
