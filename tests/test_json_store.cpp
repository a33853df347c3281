#include <catch2/catch_test_macros.hpp>
#include "store/json_store.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <unistd.h>

using namespace finly;

static std::string json_test_path() {
    return "/tmp/finly_test_json_store_" + std::to_string(getpid()) + ".json";
}

struct JsonStoreFixture {
    std::string path = json_test_path();
    JsonStore store{path};

    ~JsonStoreFixture() {
        std::filesystem::remove(path);
        std::filesystem::remove(path + ".tmp");
    }
};

TEST_CASE("JsonStore: set then get", "[json_store]") {
    JsonStoreFixture f;
    REQUIRE(f.store.backend_name() == "json");
    REQUIRE_FALSE(f.store.get("k").has_value());
    f.store.set("k", "v");
    REQUIRE(f.store.get("k").value_or("") == "v");
}

TEST_CASE("JsonStore: file is a flat JSON object", "[json_store]") {
    JsonStoreFixture f;
    f.store.set("auth:access_token", "tok");
    f.store.set("cache:categories", R"({"data":[],"stored_at":1})");

    std::ifstream in(f.path);
    auto j = nlohmann::json::parse(in);
    REQUIRE(j.is_object());
    REQUIRE(j["auth:access_token"] == "tok");
    REQUIRE(j["cache:categories"].is_string());
}

TEST_CASE("JsonStore: values survive reopen", "[json_store]") {
    JsonStoreFixture f;
    f.store.set("auth:refresh_token", "r1");
    f.store.set("other", "x");
    f.store.remove("other");

    JsonStore reopened(f.path);
    REQUIRE(reopened.get("auth:refresh_token").value_or("") == "r1");
    REQUIRE_FALSE(reopened.get("other").has_value());
}

TEST_CASE("JsonStore: remove and remove_many", "[json_store]") {
    JsonStoreFixture f;
    f.store.set("a", "1");
    f.store.set("b", "2");
    f.store.set("c", "3");
    REQUIRE(f.store.remove("a"));
    REQUIRE_FALSE(f.store.remove("a"));
    REQUIRE(f.store.remove_many({"b", "c", "d"}) == 2);
    REQUIRE(f.store.keys_with_prefix("").empty());
}

TEST_CASE("JsonStore: keys_with_prefix is ordered", "[json_store]") {
    JsonStoreFixture f;
    f.store.set("cache:b", "1");
    f.store.set("cache:a", "2");
    f.store.set("auth:x", "3");
    REQUIRE(f.store.keys_with_prefix("cache:") ==
            std::vector<std::string>{"cache:a", "cache:b"});
}

TEST_CASE("JsonStore: corrupt file starts empty", "[json_store]") {
    std::string path = json_test_path() + ".corrupt";
    {
        std::ofstream out(path);
        out << "{ not json";
    }
    JsonStore store(path);
    REQUIRE(store.keys_with_prefix("").empty());
    store.set("k", "v");
    REQUIRE(store.get("k").value_or("") == "v");
    std::filesystem::remove(path);
}

TEST_CASE("JsonStore: unwritable path throws on write", "[json_store]") {
    JsonStore store("/proc/finly_no_such_dir/store.json");
    REQUIRE_THROWS_AS(store.set("k", "v"), std::runtime_error);
}

TEST_CASE("JsonStore: failed write leaves memory matching disk", "[json_store]") {
    JsonStoreFixture f;
    f.store.set("kept", "1");
    f.store.set("other", "2");

    // A directory at the temp path makes every later save fail.
    std::filesystem::create_directory(f.path + ".tmp");

    REQUIRE_THROWS_AS(f.store.set("kept", "changed"), std::runtime_error);
    REQUIRE_THROWS_AS(f.store.set("new", "x"), std::runtime_error);
    REQUIRE_THROWS_AS(f.store.remove("other"), std::runtime_error);
    REQUIRE_THROWS_AS(f.store.remove_many({"kept", "other"}), std::runtime_error);

    REQUIRE(f.store.get("kept") == "1");
    REQUIRE(f.store.get("other") == "2");
    REQUIRE_FALSE(f.store.get("new").has_value());

    JsonStore reopened(f.path);
    REQUIRE(reopened.get("kept") == "1");
    REQUIRE(reopened.get("other") == "2");
}
