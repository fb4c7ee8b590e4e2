#pragma once

#include <string>
#include <vector>
#include <memory>
#include "plover/types.hpp"

namespace plover::engine {

    struct Config;
    class EmbeddingCache;

    /**
     * @brief Abstract base class for text embedding providers.
     *
     * Providers never retry. Rate limiting and backoff are left to the caller.
     */
    class Embedder {
    public:
        virtual ~Embedder() = default;

        /**
         * @brief Generates an embedding vector for the given text.
         * @throws RateLimited when the provider rejects the call for quota reasons.
         * @throws EmbeddingError for any other provider or transport failure.
         */
        virtual Vector embed(const std::string& text) = 0;

        /**
         * @brief Dimension of the last vector produced, 0 before the first call.
         */
        virtual size_t dimension() const = 0;

        /**
         * @brief Identifies the model, used as the cache namespace.
         */
        virtual std::string model() const = 0;
    };

    /**
     * @brief Serves embeddings from an EmbeddingCache, falling back to the wrapped provider.
     */
    class CachedEmbedder : public Embedder {
    public:
        CachedEmbedder(std::unique_ptr<Embedder> inner, std::shared_ptr<EmbeddingCache> cache);

        Vector embed(const std::string& text) override;
        size_t dimension() const override;
        std::string model() const override { return m_inner->model(); }

    private:
        std::unique_ptr<Embedder> m_inner;
        std::shared_ptr<EmbeddingCache> m_cache;
        size_t m_dimension = 0;
    };

    std::unique_ptr<Embedder> create_ollama_embedder(const std::string& model,
                                                     const std::string& endpoint = "http://localhost:11434/api/embeddings");
    std::unique_ptr<Embedder> create_openai_embedder(const std::string& api_key, const std::string& model = "text-embedding-3-small");

    /**
     * @brief Decode a provider's HTTP reply into an embedding.
     * @throws RateLimited on status 429.
     * @throws EmbeddingError for error statuses or a malformed body.
     */
    Vector parse_ollama_reply(long status, const std::string& body);
    Vector parse_openai_reply(long status, const std::string& body);

    /**
     * @brief Builds the provider selected by the config, wrapped in a cache when one is configured.
     */
    std::unique_ptr<Embedder> create_embedder(const Config& config);

}
