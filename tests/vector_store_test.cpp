#include <catch2/catch.hpp>

#include <cmath>
#include <fstream>
#include <limits>
#include <random>

#include "engine/vector_store.hpp"
#include "plover/errors.hpp"
#include "test_utils.hpp"

using namespace plover;
using namespace plover::engine;
using json = nlohmann::json;

namespace
{
    void write_file(const std::filesystem::path& path, const std::string& content)
    {
        std::ofstream f(path, std::ios::trunc);
        f << content;
    }
}

TEST_CASE("Ids are assigned monotonically and never reused", "[store]")
{
    VectorStore store(2);
    RecordId a = store.add({1, 0}, {{"n", 1}});
    RecordId b = store.add({0, 1}, {{"n", 2}});
    REQUIRE(a == 0);
    REQUIRE(b == 1);

    REQUIRE(store.remove(b));
    RecordId c = store.add({1, 1});
    REQUIRE(c == 2);
    REQUIRE(store.next_id() == 3);
    REQUIRE(store.size() == 2);
}

TEST_CASE("Dimension is enforced on insert", "[store]")
{
    VectorStore store(3);
    REQUIRE_THROWS_AS(store.add({1, 2}), DimensionMismatch);
    REQUIRE_THROWS_AS(store.add({1, 2, 3, 4}), DimensionMismatch);
    REQUIRE_THROWS_AS(store.add({}), DimensionMismatch);
    REQUIRE(store.empty());
    REQUIRE(store.next_id() == 0);

    store.add({1, 2, 3});
    REQUIRE_THROWS_AS(store.add({1, 2}), DimensionMismatch);
    REQUIRE(store.size() == 1);

    REQUIRE_THROWS_AS(VectorStore(0), std::invalid_argument);
}

TEST_CASE("Get returns the stored record", "[store]")
{
    VectorStore store(3);
    RecordId id = store.add({0.5f, -1, 2}, {{"title", "x"}, {"tags", {"a", "b"}}});

    auto rec = store.get(id);
    REQUIRE(rec.id == id);
    REQUIRE(rec.vector == Vector{0.5f, -1, 2});
    REQUIRE(rec.metadata["title"] == "x");
    REQUIRE(rec.metadata["tags"].size() == 2);

    REQUIRE_THROWS_AS(store.get(42), NotFound);
}

TEST_CASE("Delete semantics", "[store]")
{
    VectorStore store(1);
    RecordId id = store.add({1});
    store.add({2});

    REQUIRE(store.remove(id));
    REQUIRE_THROWS_AS(store.get(id), NotFound);
    REQUIRE_FALSE(store.contains(id));

    auto before = store.get_all();
    auto generation = store.generation();
    REQUIRE_FALSE(store.remove(id));
    REQUIRE_FALSE(store.remove(99));
    REQUIRE(store.get_all().size() == before.size());
    REQUIRE(store.generation() == generation);
}

TEST_CASE("get_all lists live records in id order", "[store]")
{
    VectorStore store(1);
    for (int i = 0; i < 5; ++i) store.add({static_cast<float>(i)});
    store.remove(2);

    auto all = store.get_all();
    REQUIRE(all.size() == 4);
    std::vector<RecordId> ids;
    for (const auto& r : all) ids.push_back(r.id);
    REQUIRE(ids == std::vector<RecordId>{0, 1, 3, 4});
    REQUIRE(all[2].vector == Vector{3});
}

TEST_CASE("Generation moves on every mutation", "[store]")
{
    VectorStore store(1);
    auto g0 = store.generation();
    RecordId id = store.add({1});
    REQUIRE(store.generation() > g0);
    auto g1 = store.generation();
    store.remove(id);
    REQUIRE(store.generation() > g1);
}

TEST_CASE("Save and load round trip", "[store][persistence]")
{
    test::TempDir dir;
    const auto path = dir.file("store.json");

    std::mt19937 rng(7);
    VectorStore store(8);
    for (int i = 0; i < 20; ++i) {
        store.add(test::random_vector(rng, 8), {{"i", i}, {"label", "item-" + std::to_string(i)}});
    }
    store.remove(3);
    store.remove(19);
    store.save(path);

    auto loaded = VectorStore::load(path);
    REQUIRE(loaded.dimension() == store.dimension());
    REQUIRE(loaded.next_id() == store.next_id());
    REQUIRE(loaded.size() == store.size());

    auto expected = store.get_all();
    auto actual = loaded.get_all();
    REQUIRE(actual.size() == expected.size());
    for (size_t i = 0; i < expected.size(); ++i) {
        REQUIRE(actual[i].id == expected[i].id);
        REQUIRE(actual[i].metadata == expected[i].metadata);
        for (size_t d = 0; d < 8; ++d) {
            REQUIRE(actual[i].vector[d] == Approx(expected[i].vector[d]));
        }
    }

    // Deleted ids stay retired after a reload.
    REQUIRE(loaded.add(test::random_vector(rng, 8)) == 20);
}

TEST_CASE("Non-finite components are rejected on insert", "[store]")
{
    VectorStore store(2);
    const float nan = std::numeric_limits<float>::quiet_NaN();
    const float inf = std::numeric_limits<float>::infinity();

    REQUIRE_THROWS_AS(store.add({nan, 1}), InvalidVector);
    REQUIRE_THROWS_AS(store.add({inf, 1}), InvalidVector);
    REQUIRE_THROWS_AS(store.add({1, -inf}), InvalidVector);
    REQUIRE(store.empty());
    REQUIRE(store.next_id() == 0);
    REQUIRE(store.generation() == 0);

    // The store stays savable and loadable afterwards.
    test::TempDir dir;
    store.add({1, 2});
    store.save(dir.file("store.json"));
    REQUIRE(VectorStore::load(dir.file("store.json")).size() == 1);
}

TEST_CASE("Round trip preserves extreme component values", "[store][persistence]")
{
    test::TempDir dir;
    const auto path = dir.file("store.json");
    const float max = std::numeric_limits<float>::max();
    const float min_normal = std::numeric_limits<float>::min();
    const float denorm = std::numeric_limits<float>::denorm_min();

    VectorStore store(4);
    store.add({max, -max, 3.4e38f, -3.4e38f});
    store.add({min_normal, -min_normal, denorm, -denorm});
    store.add({0.0f, -0.0f, 1e-30f, 0.1f});
    store.save(path);

    auto loaded = VectorStore::load(path);
    REQUIRE(loaded.size() == 3);
    for (RecordId id = 0; id < 3; ++id) {
        // Exact equality: every float survives the decimal text form unchanged.
        REQUIRE(loaded.get(id).vector == store.get(id).vector);
    }
    REQUIRE(std::signbit(loaded.get(2).vector[1]));
}

TEST_CASE("Round trip of a store emptied by deletes", "[store][persistence]")
{
    test::TempDir dir;
    const auto path = dir.file("store.json");

    VectorStore store(3);
    store.add({1, 2, 3});
    store.add({4, 5, 6});
    store.remove(0);
    store.remove(1);
    REQUIRE(store.empty());
    store.save(path);

    auto loaded = VectorStore::load(path);
    REQUIRE(loaded.empty());
    REQUIRE(loaded.dimension() == 3);
    REQUIRE(loaded.next_id() == 2);
    REQUIRE(loaded.add({7, 8, 9}) == 2);
}

TEST_CASE("Persisted file uses string ids", "[store][persistence]")
{
    test::TempDir dir;
    const auto path = dir.file("store.json");

    VectorStore store(2);
    store.add({1, 2}, {{"t", "a"}});
    store.add({3, 4}, {{"t", "b"}});
    store.remove(0);
    store.save(path);

    std::ifstream f(path);
    json doc = json::parse(f);
    REQUIRE(doc["dimension"] == 2);
    REQUIRE(doc["next_id"] == 2);
    REQUIRE(doc["vectors"].size() == 1);
    REQUIRE(doc["vectors"].contains("1"));
    REQUIRE(doc["metadata"]["1"]["t"] == "b");
}

TEST_CASE("Save overwrites existing content", "[store][persistence]")
{
    test::TempDir dir;
    const auto path = dir.file("store.json");
    write_file(path, std::string(4096, 'x'));

    VectorStore store(1);
    store.add({1});
    store.save(path);
    REQUIRE(VectorStore::load(path).size() == 1);
}

TEST_CASE("Loading a malformed file fails with CorruptData", "[store][persistence]")
{
    test::TempDir dir;
    const auto path = dir.file("bad.json");

    auto check = [&](const std::string& content) {
        write_file(path, content);
        REQUIRE_THROWS_AS(VectorStore::load(path), CorruptData);
    };

    SECTION("not JSON") { check("{not json"); }
    SECTION("not an object") { check("[1, 2, 3]"); }
    SECTION("missing dimension") { check(R"({"next_id": 0, "vectors": {}, "metadata": {}})"); }
    SECTION("missing next_id") { check(R"({"dimension": 2, "vectors": {}, "metadata": {}})"); }
    SECTION("missing vectors") { check(R"({"dimension": 2, "next_id": 0, "metadata": {}})"); }
    SECTION("missing metadata") { check(R"({"dimension": 2, "next_id": 0, "vectors": {}})"); }
    SECTION("dimension is a string") { check(R"({"dimension": "2", "next_id": 0, "vectors": {}, "metadata": {}})"); }
    SECTION("zero dimension") { check(R"({"dimension": 0, "next_id": 0, "vectors": {}, "metadata": {}})"); }
    SECTION("negative next_id") { check(R"({"dimension": 2, "next_id": -1, "vectors": {}, "metadata": {}})"); }
    SECTION("vectors is an array") { check(R"({"dimension": 2, "next_id": 1, "vectors": [[1, 2]], "metadata": {}})"); }
    SECTION("non-integer key") {
        check(R"({"dimension": 2, "next_id": 1, "vectors": {"a": [1, 2]}, "metadata": {"a": {}}})");
    }
    SECTION("wrong vector length") {
        check(R"({"dimension": 2, "next_id": 1, "vectors": {"0": [1, 2, 3]}, "metadata": {"0": {}}})");
    }
    SECTION("non-numeric component") {
        check(R"({"dimension": 2, "next_id": 1, "vectors": {"0": [1, "x"]}, "metadata": {"0": {}}})");
    }
    SECTION("key sets differ") {
        check(R"({"dimension": 2, "next_id": 2, "vectors": {"0": [1, 2]}, "metadata": {"1": {}}})");
    }
    SECTION("metadata has extra ids") {
        check(R"({"dimension": 2, "next_id": 2, "vectors": {"0": [1, 2]}, "metadata": {"0": {}, "1": {}}})");
    }
    SECTION("component beyond the float range") {
        check(R"({"dimension": 2, "next_id": 1, "vectors": {"0": [1e39, 2]}, "metadata": {"0": {}}})");
    }
    SECTION("null component") {
        check(R"({"dimension": 2, "next_id": 1, "vectors": {"0": [null, 1.0]}, "metadata": {"0": {}}})");
    }
    SECTION("id not below next_id") {
        check(R"({"dimension": 2, "next_id": 1, "vectors": {"5": [1, 2]}, "metadata": {"5": {}}})");
    }
}

TEST_CASE("Loading a missing file fails with StorageError", "[store][persistence]")
{
    test::TempDir dir;
    REQUIRE_THROWS_AS(VectorStore::load(dir.file("absent.json")), StorageError);
}

TEST_CASE("Loaded metadata may be any JSON value", "[store][persistence]")
{
    test::TempDir dir;
    const auto path = dir.file("store.json");
    write_file(path, R"({"dimension": 1, "next_id": 3,
                         "vectors": {"0": [1], "2": [2.5]},
                         "metadata": {"0": "plain string", "2": null}})");

    auto store = VectorStore::load(path);
    REQUIRE(store.size() == 2);
    REQUIRE(store.get(0).metadata == "plain string");
    REQUIRE(store.get(2).metadata.is_null());
    REQUIRE(store.get(2).vector[0] == Approx(2.5f));
    REQUIRE(store.add({0}) == 3);
}
