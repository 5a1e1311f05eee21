#include "backend/ViewBuilder.hpp"
#include "backend/Errors.hpp"
#include "backend/Flattener.hpp"

namespace minstrel::backend {

using model::ModelType;

ViewBuilder::ViewBuilder() {
    const std::vector<std::string> identity = {"id", "name"};

    table_[{View::Search, ModelType::FullArtist}] = {{"id", "name", "genres", "images"}, identity};
    table_[{View::Search, ModelType::SimpleAlbum}] = {{"id", "name", "artists", "release_date", "images"}, identity};
    table_[{View::Search, ModelType::FullAlbum}] = {{"id", "name", "artists", "release_date", "images"}, identity};
    table_[{View::Search, ModelType::SimpleTrack}] = {{"id", "name", "disc_number", "track_number", "duration_ms"}, identity};
    table_[{View::Search, ModelType::FullTrack}] = {{"id", "name", "artists", "album"}, identity};

    table_[{View::Detail, ModelType::FullArtist}] = {{"id", "name", "popularity", "genres", "images"}, identity};
    table_[{View::Detail, ModelType::FullAlbum}] = {
        {"id", "name", "popularity", "genres", "release_date", "total_tracks", "label", "artists", "images"},
        identity};
    table_[{View::Detail, ModelType::FullTrack}] = {
        {"id", "name", "popularity", "disc_number", "track_number", "artists", "album", "duration_ms"},
        identity};
    table_[{View::Detail, ModelType::AudioFeatures}] = {{"danceability", "energy", "valence"}, {}};
}

const AllowList* ViewBuilder::allow_list(View view, ModelType type) const {
    auto it = table_.find({view, type});
    return it == table_.end() ? nullptr : &it->second;
}

Json::Value ViewBuilder::search_view(const model::Model& model) const {
    if (!model.is<model::Paging>()) {
        throw UnsupportedModel(std::string("search view expects a Paging, got ") + model.kind_name());
    }

    Json::Value list(Json::arrayValue);
    for (const auto& entry : model.as<model::Paging>().items) {
        if (!entry.is<model::Item>()) {
            throw UnsupportedModel(std::string("search results must be items, got ") + entry.kind_name());
        }
        list.append(search_record(entry.as<model::Item>()));
    }
    return list;
}

Json::Value ViewBuilder::search_record(const model::Item& item) const {
    return record(View::Search, item);
}

Json::Value ViewBuilder::detail_view(const model::Model& model) const {
    if (!model.is<model::Item>()) {
        throw UnsupportedModel(std::string("detail view expects an Item, got ") + model.kind_name());
    }
    return record(View::Detail, model.as<model::Item>());
}

Json::Value ViewBuilder::record(View view, const model::Item& item) const {
    const char* view_name = view == View::Search ? "search" : "detail";

    const AllowList* fields = allow_list(view, item.model_type);
    if (!fields) {
        throw UnsupportedModel(std::string("no ") + view_name + " view for " + model::to_string(item.model_type));
    }

    Json::Value out(Json::objectValue);
    for (const auto& key : fields->fields) {
        const model::Model* value = item.find(key);
        out[key] = value ? Flattener::flatten(*value) : Json::Value();
    }

    for (const auto& key : fields->required) {
        if (out[key].isNull()) {
            throw MalformedRemoteResult(std::string(model::to_string(item.model_type)) + " " + view_name +
                                        " record is missing '" + key + "'");
        }
    }
    return out;
}

}  // namespace minstrel::backend
