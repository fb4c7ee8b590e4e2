#include "embedder.hpp"
#include "config.hpp"
#include "embedding_cache.hpp"
#include <iostream>

namespace plover::engine {

    CachedEmbedder::CachedEmbedder(std::unique_ptr<Embedder> inner, std::shared_ptr<EmbeddingCache> cache)
        : m_inner(std::move(inner)), m_cache(std::move(cache)) {
        if (!m_inner || !m_cache) throw std::invalid_argument("CachedEmbedder needs a provider and a cache");
    }

    Vector CachedEmbedder::embed(const std::string& text) {
        const std::string model = m_inner->model();
        if (auto hit = m_cache->get(model, text)) {
            m_dimension = hit->size();
            return *hit;
        }

        Vector embedding = m_inner->embed(text);
        if (!m_cache->put(model, text, embedding)) {
            std::cerr << "[CachedEmbedder] Warning: failed to cache embedding for model " << model << "\n";
        }
        m_dimension = embedding.size();
        return embedding;
    }

    size_t CachedEmbedder::dimension() const {
        return m_dimension ? m_dimension : m_inner->dimension();
    }

    std::unique_ptr<Embedder> create_embedder(const Config& config) {
        std::unique_ptr<Embedder> embedder;
        if (config.embedding_backend == "openai") {
            if (config.openai_key.empty()) throw std::invalid_argument("openai backend selected but no API key configured");
            std::cerr << "[Plover] Using OpenAI Embedder.\n";
            embedder = create_openai_embedder(config.openai_key, config.embedding_model);
        } else {
            std::cerr << "[Plover] Using Ollama Embedder (" << config.embedding_model << ").\n";
            embedder = create_ollama_embedder(config.embedding_model, config.embedding_endpoint);
        }

        if (!config.embedding_cache.empty()) {
            auto cache = std::make_shared<EmbeddingCache>(config.embedding_cache);
            embedder = std::make_unique<CachedEmbedder>(std::move(embedder), std::move(cache));
        }
        return embedder;
    }

}
