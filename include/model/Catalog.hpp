#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>
#include <json/json.h>

namespace minstrel::model {

/// Schema tag of an Item. Drives the view allow-lists; the payload's own
/// "type" attribute ("artist", "album"...) is kept separately as data.
enum class ModelType {
    FullArtist,
    SimpleArtist,
    FullAlbum,
    SimpleAlbum,
    FullTrack,
    SimpleTrack,
    AudioFeatures,
    Unknown,
};

inline const char* to_string(ModelType type) {
    switch (type) {
        case ModelType::FullArtist: return "FullArtist";
        case ModelType::SimpleArtist: return "SimpleArtist";
        case ModelType::FullAlbum: return "FullAlbum";
        case ModelType::SimpleAlbum: return "SimpleAlbum";
        case ModelType::FullTrack: return "FullTrack";
        case ModelType::SimpleTrack: return "SimpleTrack";
        case ModelType::AudioFeatures: return "AudioFeatures";
        case ModelType::Unknown: return "Unknown";
    }
    return "Unknown";
}

struct Model;

// Page of results; the cursor is carried but never followed by the core.
struct Paging {
    std::vector<Model> items;
    int64_t total = 0;
    std::optional<std::string> next;
};

struct Collection {
    std::vector<Model> items;
};

struct Image {
    std::string url;
    std::optional<int> width;
    std::optional<int> height;
};

/// Catalog object with identity. Attributes keep payload order.
struct Item {
    ModelType model_type = ModelType::Unknown;
    std::vector<std::pair<std::string, Model>> attributes;

    [[nodiscard]] const Model* find(std::string_view key) const;
    [[nodiscard]] std::optional<std::string> text(std::string_view key) const;
};

/// Primitive or plain structured leaf (strings, numbers, genre lists,
/// follower counts...). Stored in its JSON form.
struct Scalar {
    Json::Value value;
};

struct Model {
    std::variant<Paging, Collection, Image, Item, Scalar> node;

    template <typename T>
    [[nodiscard]] bool is() const { return std::holds_alternative<T>(node); }

    template <typename T>
    [[nodiscard]] const T& as() const { return std::get<T>(node); }

    [[nodiscard]] const char* kind_name() const {
        static constexpr const char* names[] = {"Paging", "Collection", "Image", "Item", "Scalar"};
        return names[node.index()];
    }

    static Model scalar(Json::Value value) { return Model{Scalar{std::move(value)}}; }
    static Model image(std::string url) { return Model{Image{std::move(url), std::nullopt, std::nullopt}}; }
    static Model collection(std::vector<Model> items) { return Model{Collection{std::move(items)}}; }

    static Model paging(std::vector<Model> items, std::optional<std::string> next = std::nullopt) {
        auto total = static_cast<int64_t>(items.size());
        return Model{Paging{std::move(items), total, std::move(next)}};
    }

    static Model item(ModelType type, std::vector<std::pair<std::string, Model>> attributes) {
        return Model{Item{type, std::move(attributes)}};
    }
};

inline const Model* Item::find(std::string_view key) const {
    for (const auto& [name, value] : attributes) {
        if (name == key) return &value;
    }
    return nullptr;
}

inline std::optional<std::string> Item::text(std::string_view key) const {
    const Model* value = find(key);
    if (!value || !value->is<Scalar>()) return std::nullopt;
    const auto& json = value->as<Scalar>().value;
    if (!json.isString()) return std::nullopt;
    return json.asString();
}

/// One paging per requested type, as returned by a catalog search.
struct SearchResult {
    std::string type;  // singular: "artist", "album", "track"
    Model paging;
};

}  // namespace minstrel::model
