#include "../framework/SimpleTest.hpp"
#include "backend/Errors.hpp"
#include "backend/Flattener.hpp"
#include "backend/ViewBuilder.hpp"

using namespace minstrel::backend;
using minstrel::model::Model;
using minstrel::model::ModelType;

namespace {

Model text(const std::string& s) { return Model::scalar(Json::Value(s)); }

Model artist_ref(const std::string& id, const std::string& name) {
    return Model::item(ModelType::SimpleArtist, {{"id", text(id)}, {"type", text("artist")}, {"name", text(name)}});
}

Model full_track(const std::string& id, const std::string& name) {
    return Model::item(ModelType::FullTrack, {
        {"id", text(id)},
        {"type", text("track")},
        {"name", text(name)},
        {"popularity", Model::scalar(Json::Value(80))},
        {"artists", Model::collection({artist_ref("ar1", "The Beatles"), artist_ref("ar9", "Guest")})},
        {"album", Model::item(ModelType::SimpleAlbum, {
            {"id", text("al1")}, {"type", text("album")}, {"name", text("Help!")},
            {"images", Model::collection({Model::image("https://img/help.jpg")})}})},
    });
}

}  // namespace

TEST_CASE(test_search_view_one_record_per_item) {
    ViewBuilder views;
    Model page = Model::paging({full_track("t1", "Yesterday"), full_track("t2", "Help!"), full_track("t3", "Girl")});

    Json::Value records = views.search_view(page);
    ASSERT_TRUE(records.isArray());
    ASSERT_EQ(records.size(), 3u);
    ASSERT_EQ(records[0]["id"].asString(), "t1");
    ASSERT_EQ(records[2]["name"].asString(), "Girl");
}

TEST_CASE(test_search_view_of_empty_page) {
    ViewBuilder views;
    Json::Value records = views.search_view(Model::paging({}));
    ASSERT_TRUE(records.isArray());
    ASSERT_EQ(records.size(), 0u);
}

TEST_CASE(test_record_keeps_only_allow_listed_fields) {
    ViewBuilder views;
    Json::Value record = views.search_view(Model::paging({full_track("t1", "Yesterday")}))[0];

    ASSERT_EQ(record.size(), 4u);
    ASSERT_TRUE(record.isMember("artists"));
    ASSERT_TRUE(record.isMember("album"));
    ASSERT_FALSE(record.isMember("popularity"));
    ASSERT_FALSE(record.isMember("type"));
}

TEST_CASE(test_nested_values_are_flattened) {
    ViewBuilder views;
    Json::Value record = views.search_view(Model::paging({full_track("t1", "Yesterday")}))[0];

    // Collection of artists reduces to the lead artist reference
    ASSERT_EQ(record["artists"]["id"].asString(), "ar1");
    ASSERT_EQ(record["artists"]["type"].asString(), "artist");
    ASSERT_EQ(record["artists"]["name"].asString(), "The Beatles");
    ASSERT_EQ(record["artists"].size(), 3u);

    ASSERT_EQ(record["album"]["id"].asString(), "al1");
    ASSERT_EQ(record["album"]["name"].asString(), "Help!");
    ASSERT_FALSE(record["album"].isMember("images"));
}

TEST_CASE(test_missing_allow_listed_field_is_null) {
    ViewBuilder views;
    Model artist = Model::item(ModelType::FullArtist, {
        {"id", text("ar1")}, {"type", text("artist")}, {"name", text("The Beatles")},
        {"images", Model::collection({})},
    });

    Json::Value record = views.detail_view(artist);
    ASSERT_TRUE(record.isMember("popularity"));
    ASSERT_TRUE(record["popularity"].isNull());
    ASSERT_TRUE(record["genres"].isNull());
    ASSERT_TRUE(record["images"].isNull());
}

TEST_CASE(test_image_collection_gives_primary_url) {
    ViewBuilder views;
    Model artist = Model::item(ModelType::FullArtist, {
        {"id", text("ar1")}, {"type", text("artist")}, {"name", text("The Beatles")},
        {"genres", Model::scalar(Json::Value(Json::arrayValue))},
        {"images", Model::collection({Model::image("https://img/large.jpg"), Model::image("https://img/small.jpg")})},
    });

    Json::Value record = views.detail_view(artist);
    ASSERT_EQ(record["images"].asString(), "https://img/large.jpg");
    ASSERT_TRUE(record["genres"].isArray());
}

TEST_CASE(test_audio_features_detail) {
    ViewBuilder views;
    Model features = Model::item(ModelType::AudioFeatures, {
        {"type", text("audio_features")},
        {"danceability", Model::scalar(Json::Value(0.5))},
        {"energy", Model::scalar(Json::Value(0.25))},
        {"tempo", Model::scalar(Json::Value(120.0))},
    });

    Json::Value record = views.detail_view(features);
    ASSERT_EQ(record.size(), 3u);
    ASSERT_TRUE(record["danceability"].asDouble() == 0.5);
    ASSERT_TRUE(record["valence"].isNull());
    ASSERT_FALSE(record.isMember("tempo"));
}

TEST_CASE(test_unsupported_shapes) {
    ViewBuilder views;
    ASSERT_THROWS(views.search_view(full_track("t1", "Yesterday")), UnsupportedModel);
    ASSERT_THROWS(views.detail_view(Model::paging({})), UnsupportedModel);
    ASSERT_THROWS(views.search_view(Model::paging({text("loose")})), UnsupportedModel);

    // No detail view is defined for simplified objects
    ASSERT_THROWS(views.detail_view(artist_ref("ar1", "The Beatles")), UnsupportedModel);
    ASSERT_THROWS(views.detail_view(Model::item(ModelType::Unknown, {{"id", text("x")}})), UnsupportedModel);
}

TEST_CASE(test_required_fields) {
    ViewBuilder views;
    Model nameless = Model::item(ModelType::FullArtist, {{"id", text("ar1")}, {"type", text("artist")}});
    ASSERT_THROWS(views.detail_view(nameless), MalformedRemoteResult);

    Model album_without_id = Model::item(ModelType::SimpleAlbum, {{"type", text("album")}, {"name", text("x")}});
    ASSERT_THROWS(views.search_record(album_without_id.as<minstrel::model::Item>()), MalformedRemoteResult);
}

TEST_CASE(test_allow_list_table) {
    ViewBuilder views;
    ASSERT_TRUE(views.allow_list(View::Search, ModelType::FullArtist) != nullptr);
    ASSERT_TRUE(views.allow_list(View::Search, ModelType::SimpleTrack) != nullptr);
    ASSERT_TRUE(views.allow_list(View::Detail, ModelType::FullAlbum) != nullptr);
    ASSERT_TRUE(views.allow_list(View::Detail, ModelType::SimpleTrack) == nullptr);
    ASSERT_TRUE(views.allow_list(View::Search, ModelType::AudioFeatures) == nullptr);
    ASSERT_EQ(views.allow_list(View::Detail, ModelType::FullAlbum)->fields.size(), 9u);
}

TEST_CASE(test_flatten_variants) {
    ASSERT_EQ(Flattener::flatten(text("plain")).asString(), "plain");
    ASSERT_EQ(Flattener::flatten(Model::image("https://img/x.jpg")).asString(), "https://img/x.jpg");
    ASSERT_TRUE(Flattener::flatten(Model::collection({})).isNull());

    Json::Value list = Flattener::flatten(Model::paging({artist_ref("a", "A"), artist_ref("b", "B")}));
    ASSERT_EQ(list.size(), 2u);
    ASSERT_EQ(list[1]["id"].asString(), "b");
}

TEST_CASE(test_reference_without_optional_keys) {
    Json::Value ref = Flattener::flatten(Model::item(ModelType::SimpleArtist, {{"id", text("ar1")}}));
    ASSERT_EQ(ref["id"].asString(), "ar1");
    ASSERT_TRUE(ref.isMember("name"));
    ASSERT_TRUE(ref["name"].isNull());
    ASSERT_TRUE(ref["type"].isNull());

    ASSERT_THROWS(Flattener::flatten(Model::item(ModelType::SimpleArtist, {{"name", text("anon")}})),
                  MalformedRemoteResult);
}

int main() {
    return minstrel::test::TestRunner::instance().run_all();
}
