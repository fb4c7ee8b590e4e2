#include <catch2/catch.hpp>

#include "engine/embedder.hpp"
#include "plover/errors.hpp"

using namespace plover;
using namespace plover::engine;

TEST_CASE("OpenAI reply decoding", "[embedder]")
{
    SECTION("well formed")
    {
        auto v = parse_openai_reply(200, R"({"data": [{"embedding": [0.5, -1, 2]}]})");
        REQUIRE(v == Vector{0.5f, -1, 2});
    }
    SECTION("rate limited")
    {
        REQUIRE_THROWS_AS(parse_openai_reply(429, "slow down"), RateLimited);
    }
    SECTION("API error object")
    {
        REQUIRE_THROWS_AS(parse_openai_reply(401, R"({"error": {"message": "bad key"}})"), EmbeddingError);
    }
    SECTION("malformed replies become EmbeddingError")
    {
        for (const char* body : {"not json",
                                 "[]",
                                 R"({})",
                                 R"({"data": []})",
                                 R"({"data": {"0": {"embedding": [1]}}})",
                                 R"({"data": "text"})",
                                 R"({"data": [42]})",
                                 R"({"data": [{"embedding": "x"}]})",
                                 R"({"data": [{"embedding": []}]})"}) {
            CAPTURE(body);
            REQUIRE_THROWS_AS(parse_openai_reply(200, body), EmbeddingError);
        }
    }
}

TEST_CASE("Ollama reply decoding", "[embedder]")
{
    REQUIRE(parse_ollama_reply(200, R"({"embedding": [1, 2]})") == Vector{1, 2});
    REQUIRE_THROWS_AS(parse_ollama_reply(429, ""), RateLimited);
    REQUIRE_THROWS_AS(parse_ollama_reply(500, "boom"), EmbeddingError);
    REQUIRE_THROWS_AS(parse_ollama_reply(200, "{"), EmbeddingError);
    REQUIRE_THROWS_AS(parse_ollama_reply(200, R"({"vector": [1]})"), EmbeddingError);
    REQUIRE_THROWS_AS(parse_ollama_reply(200, R"({"embedding": []})"), EmbeddingError);
}
