#include "embedder.hpp"
#include "http_client.hpp"
#include "plover/errors.hpp"
#include <nlohmann/json.hpp>
#include <curl/curl.h>

using json = nlohmann::json;

namespace plover::engine {

    Vector parse_openai_reply(long status, const std::string& body) {
        if (status == 429) {
            throw RateLimited("[OpenAIEmbedder] rate limited: " + body);
        }

        json resp_json;
        try {
            resp_json = json::parse(body);
        } catch (const json::parse_error& e) {
            throw EmbeddingError(std::string("[OpenAIEmbedder] JSON parse error: ") + e.what());
        }

        if (resp_json.contains("error")) {
            throw EmbeddingError("[OpenAIEmbedder] API Error: " + resp_json["error"].dump());
        }
        if (status >= 400) {
            throw EmbeddingError("[OpenAIEmbedder] HTTP " + std::to_string(status));
        }
        auto data = resp_json.find("data");
        if (data == resp_json.end() || !data->is_array() || data->empty()) {
            throw EmbeddingError("[OpenAIEmbedder] response has no data");
        }

        Vector embedding;
        try {
            embedding = data->at(0).at("embedding").get<Vector>();
        } catch (const json::exception& e) {
            throw EmbeddingError(std::string("[OpenAIEmbedder] malformed embedding: ") + e.what());
        }
        if (embedding.empty()) throw EmbeddingError("[OpenAIEmbedder] empty embedding returned");
        return embedding;
    }

    class OpenAIEmbedder : public Embedder {
    public:
        OpenAIEmbedder(const std::string& api_key, const std::string& model)
            : m_api_key(api_key), m_model(model) {
            curl_global_init(CURL_GLOBAL_DEFAULT);
        }

        ~OpenAIEmbedder() override {
            curl_global_cleanup();
        }

        Vector embed(const std::string& text) override {
            json body = {
                {"model", m_model},
                {"input", text}
            };

            auto response = http::post_json("https://api.openai.com/v1/embeddings",
                                            body.dump(-1, ' ', false, json::error_handler_t::replace),
                                            {"Authorization: Bearer " + m_api_key});

            Vector embedding = parse_openai_reply(response.status, response.body);
            m_dimension = embedding.size();
            return embedding;
        }

        size_t dimension() const override { return m_dimension; }
        std::string model() const override { return "openai:" + m_model; }

    private:
        std::string m_api_key;
        std::string m_model;
        size_t m_dimension = 0;
    };

    std::unique_ptr<Embedder> create_openai_embedder(const std::string& api_key, const std::string& model) {
        return std::make_unique<OpenAIEmbedder>(api_key, model);
    }

}
