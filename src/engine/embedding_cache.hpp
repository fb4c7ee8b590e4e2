#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <sqlite3.h>
#include "plover/types.hpp"

namespace plover::engine {

    /**
     * @brief SQLite-backed store of computed embeddings, keyed by (model, text).
     */
    class EmbeddingCache {
    public:
        /**
         * @brief Opens (or creates) the cache database. ":memory:" gives a private in-memory cache.
         * @throws StorageError if the database cannot be opened or initialized.
         */
        explicit EmbeddingCache(const std::filesystem::path& path);
        ~EmbeddingCache();

        EmbeddingCache(const EmbeddingCache&) = delete;
        EmbeddingCache& operator=(const EmbeddingCache&) = delete;

        std::optional<Vector> get(const std::string& model, const std::string& text) const;

        /**
         * @brief Inserts or replaces an entry.
         * @return false if the write failed.
         */
        bool put(const std::string& model, const std::string& text, const Vector& embedding);

        size_t size() const;
        bool clear();

    private:
        sqlite3* m_db = nullptr;

        void initialize_schema();
    };

}
