#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <vector>
#include <nlohmann/json.hpp>
#include "plover/types.hpp"

namespace plover::engine {

    /**
     * @brief Owns the canonical (id, vector, metadata) collection.
     *
     * Ids come from a monotonically increasing counter and are never reused,
     * even after the record holding them is removed.
     */
    class VectorStore {
    public:
        explicit VectorStore(size_t dimension);

        /**
         * @brief Stores a new record.
         * @return The id assigned to it.
         * @throws DimensionMismatch if vector.size() != dimension().
         * @throws InvalidVector if a component is NaN or infinite.
         */
        RecordId add(const Vector& vector, const nlohmann::json& metadata = nlohmann::json::object());

        /**
         * @throws NotFound if no record has this id.
         */
        VectorRecord get(RecordId id) const;

        /**
         * @brief Removes a record.
         * @return false if the id was not present.
         */
        bool remove(RecordId id);

        bool contains(RecordId id) const;

        /**
         * @brief Snapshot of all live records, in ascending id order.
         */
        std::vector<VectorRecord> get_all() const;

        /**
         * @brief Writes the whole store to path, replacing its content.
         * @throws StorageError if the file cannot be written.
         */
        void save(const std::filesystem::path& path) const;

        /**
         * @throws StorageError if the file cannot be read.
         * @throws CorruptData if the document does not describe a valid store.
         */
        static VectorStore load(const std::filesystem::path& path);

        nlohmann::json to_json() const;
        static VectorStore from_json(const nlohmann::json& doc);

        size_t dimension() const { return m_dimension; }
        RecordId next_id() const { return m_next_id; }
        size_t size() const { return m_vectors.size(); }
        bool empty() const { return m_vectors.empty(); }

        // Bumped on every mutation; not persisted.
        std::uint64_t generation() const { return m_generation; }

    private:
        size_t m_dimension;
        RecordId m_next_id = 0;
        std::uint64_t m_generation = 0;
        std::map<RecordId, Vector> m_vectors;
        std::map<RecordId, nlohmann::json> m_metadata;
    };

}
