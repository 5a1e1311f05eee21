#include "backend/Flattener.hpp"
#include "backend/Errors.hpp"

namespace minstrel::backend {

namespace {

template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

Json::Value optional_text(const model::Item& item, const char* key) {
    auto value = item.text(key);
    return value ? Json::Value(*value) : Json::Value();
}

}  // namespace

Json::Value Flattener::flatten(const model::Model& model) {
    return std::visit(Overloaded{
        [](const model::Paging& paging) {
            Json::Value list(Json::arrayValue);
            for (const auto& item : paging.items) {
                list.append(flatten(item));
            }
            return list;
        },
        [](const model::Collection& collection) {
            // A collection stands for one logical value: the primary image, the lead artist
            if (collection.items.empty()) {
                return Json::Value();
            }
            return flatten(collection.items.front());
        },
        [](const model::Image& image) {
            return Json::Value(image.url);
        },
        [](const model::Item& item) {
            return reference(item);
        },
        [](const model::Scalar& scalar) {
            return scalar.value;
        },
    }, model.node);
}

Json::Value Flattener::reference(const model::Item& item) {
    auto id = item.text("id");
    if (!id) {
        throw MalformedRemoteResult(std::string("nested ") + model::to_string(item.model_type) +
                                    " reference has no id");
    }

    Json::Value ref(Json::objectValue);
    ref["id"] = *id;
    ref["type"] = optional_text(item, "type");
    ref["name"] = optional_text(item, "name");
    return ref;
}

}  // namespace minstrel::backend
