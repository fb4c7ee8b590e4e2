#include "embedder.hpp"
#include "http_client.hpp"
#include "plover/errors.hpp"
#include <nlohmann/json.hpp>
#include <curl/curl.h>

using json = nlohmann::json;

namespace plover::engine {

    Vector parse_ollama_reply(long status, const std::string& body) {
        if (status == 429) {
            throw RateLimited("[OllamaEmbedder] rate limited");
        }
        if (status >= 400) {
            throw EmbeddingError("[OllamaEmbedder] HTTP " + std::to_string(status) + ": " + body);
        }

        Vector embedding;
        try {
            auto resp_json = json::parse(body);
            if (!resp_json.contains("embedding")) {
                throw EmbeddingError("[OllamaEmbedder] response has no 'embedding' field");
            }
            embedding = resp_json["embedding"].get<Vector>();
        } catch (const json::exception& e) {
            throw EmbeddingError(std::string("[OllamaEmbedder] JSON parse error: ") + e.what());
        }

        if (embedding.empty()) throw EmbeddingError("[OllamaEmbedder] empty embedding returned");
        return embedding;
    }

    class OllamaEmbedder : public Embedder {
    public:
        OllamaEmbedder(const std::string& model, const std::string& endpoint)
            : m_model(model), m_endpoint(endpoint) {
            curl_global_init(CURL_GLOBAL_DEFAULT);
        }

        ~OllamaEmbedder() override {
            curl_global_cleanup();
        }

        Vector embed(const std::string& text) override {
            json body = {
                {"model", m_model},
                {"prompt", text}
            };
            // Invalid UTF-8 in the input is replaced rather than rejected.
            std::string json_str = body.dump(-1, ' ', false, json::error_handler_t::replace);

            auto response = http::post_json(m_endpoint, json_str);
            Vector embedding = parse_ollama_reply(response.status, response.body);
            m_dimension = embedding.size();
            return embedding;
        }

        size_t dimension() const override { return m_dimension; }
        std::string model() const override { return "ollama:" + m_model; }

    private:
        std::string m_model;
        std::string m_endpoint;
        size_t m_dimension = 0;
    };

    std::unique_ptr<Embedder> create_ollama_embedder(const std::string& model, const std::string& endpoint) {
        return std::make_unique<OllamaEmbedder>(model, endpoint);
    }

}
