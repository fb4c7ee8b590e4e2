#include "embedding_cache.hpp"
#include "plover/errors.hpp"
#include <cstring>
#include <iostream>

namespace plover::engine {

    EmbeddingCache::EmbeddingCache(const std::filesystem::path& path) {
        if (sqlite3_open(path.c_str(), &m_db) != SQLITE_OK) {
            std::string msg = m_db ? sqlite3_errmsg(m_db) : "out of memory";
            sqlite3_close(m_db);
            m_db = nullptr;
            throw StorageError("[EmbeddingCache] Failed to open " + path.string() + ": " + msg);
        }
        initialize_schema();
    }

    EmbeddingCache::~EmbeddingCache() {
        if (m_db) {
            sqlite3_close(m_db);
            m_db = nullptr;
        }
    }

    void EmbeddingCache::initialize_schema() {
        const char* sql =
            "CREATE TABLE IF NOT EXISTS embeddings ("
            "  model TEXT NOT NULL,"
            "  text TEXT NOT NULL,"
            "  dim INTEGER NOT NULL,"
            "  vector BLOB NOT NULL,"
            "  PRIMARY KEY (model, text)"
            ");";
        char* err_msg = nullptr;
        if (sqlite3_exec(m_db, sql, nullptr, nullptr, &err_msg) != SQLITE_OK) {
            std::string e = err_msg ? err_msg : "unknown";
            sqlite3_free(err_msg);
            sqlite3_close(m_db);
            m_db = nullptr;
            throw StorageError("[EmbeddingCache] Schema error: " + e);
        }
    }

    std::optional<Vector> EmbeddingCache::get(const std::string& model, const std::string& text) const {
        const char* sql = "SELECT dim, vector FROM embeddings WHERE model = ? AND text = ?;";
        sqlite3_stmt* stmt;
        std::optional<Vector> result;

        if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            std::cerr << "[EmbeddingCache] Prepare failed: " << sqlite3_errmsg(m_db) << "\n";
            return result;
        }
        sqlite3_bind_text(stmt, 1, model.c_str(), -1, SQLITE_STATIC);
        sqlite3_bind_text(stmt, 2, text.c_str(), static_cast<int>(text.size()), SQLITE_STATIC);

        if (sqlite3_step(stmt) == SQLITE_ROW) {
            const auto dim = static_cast<size_t>(sqlite3_column_int64(stmt, 0));
            const void* blob = sqlite3_column_blob(stmt, 1);
            const auto bytes = static_cast<size_t>(sqlite3_column_bytes(stmt, 1));
            if (blob && bytes == dim * sizeof(float)) {
                Vector vec(dim);
                std::memcpy(vec.data(), blob, bytes);
                result = std::move(vec);
            } else {
                std::cerr << "[EmbeddingCache] Ignoring malformed entry for model " << model << "\n";
            }
        }
        sqlite3_finalize(stmt);
        return result;
    }

    bool EmbeddingCache::put(const std::string& model, const std::string& text, const Vector& embedding) {
        const char* sql =
            "INSERT INTO embeddings (model, text, dim, vector) VALUES (?, ?, ?, ?) "
            "ON CONFLICT(model, text) DO UPDATE SET dim = excluded.dim, vector = excluded.vector;";
        sqlite3_stmt* stmt;
        if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) return false;

        sqlite3_bind_text(stmt, 1, model.c_str(), -1, SQLITE_STATIC);
        sqlite3_bind_text(stmt, 2, text.c_str(), static_cast<int>(text.size()), SQLITE_STATIC);
        sqlite3_bind_int64(stmt, 3, static_cast<sqlite3_int64>(embedding.size()));
        sqlite3_bind_blob(stmt, 4, embedding.data(), static_cast<int>(embedding.size() * sizeof(float)), SQLITE_STATIC);

        bool success = (sqlite3_step(stmt) == SQLITE_DONE);
        sqlite3_finalize(stmt);
        return success;
    }

    size_t EmbeddingCache::size() const {
        const char* sql = "SELECT COUNT(*) FROM embeddings;";
        sqlite3_stmt* stmt;
        size_t count = 0;
        if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) == SQLITE_OK) {
            if (sqlite3_step(stmt) == SQLITE_ROW) count = static_cast<size_t>(sqlite3_column_int64(stmt, 0));
            sqlite3_finalize(stmt);
        }
        return count;
    }

    bool EmbeddingCache::clear() {
        char* err_msg = nullptr;
        if (sqlite3_exec(m_db, "DELETE FROM embeddings;", nullptr, nullptr, &err_msg) != SQLITE_OK) {
            std::cerr << "[EmbeddingCache] Clear failed: " << (err_msg ? err_msg : "unknown") << "\n";
            sqlite3_free(err_msg);
            return false;
        }
        return true;
    }

}
