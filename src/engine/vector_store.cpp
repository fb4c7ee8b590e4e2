#include "vector_store.hpp"
#include "distance.hpp"
#include "plover/errors.hpp"
#include <cmath>
#include <fstream>
#include <limits>
#include <stdexcept>

using json = nlohmann::json;

namespace plover::engine {

    namespace {

        RecordId parse_id_key(const std::string& key) {
            if (key.empty() || key.size() > 18 || (key.size() > 1 && key[0] == '0'))
                throw CorruptData("invalid id key '" + key + "'");
            for (char c : key) {
                if (c < '0' || c > '9') throw CorruptData("invalid id key '" + key + "'");
            }
            return std::stoll(key);
        }

        const json& require(const json& doc, const char* field) {
            auto it = doc.find(field);
            if (it == doc.end()) throw CorruptData(std::string("missing field '") + field + "'");
            return *it;
        }

    }

    VectorStore::VectorStore(size_t dimension) : m_dimension(dimension) {
        if (dimension == 0) throw std::invalid_argument("vector dimension must be at least 1");
    }

    RecordId VectorStore::add(const Vector& vector, const json& metadata) {
        if (vector.size() != m_dimension) throw DimensionMismatch(m_dimension, vector.size());
        if (!all_finite(vector)) throw InvalidVector("components must be finite");

        RecordId id = m_next_id++;
        m_vectors.emplace(id, vector);
        m_metadata.emplace(id, metadata);
        ++m_generation;
        return id;
    }

    VectorRecord VectorStore::get(RecordId id) const {
        auto it = m_vectors.find(id);
        if (it == m_vectors.end()) throw NotFound(id);
        return {id, it->second, m_metadata.at(id)};
    }

    bool VectorStore::remove(RecordId id) {
        if (m_vectors.erase(id) == 0) return false;
        m_metadata.erase(id);
        ++m_generation;
        return true;
    }

    bool VectorStore::contains(RecordId id) const {
        return m_vectors.count(id) != 0;
    }

    std::vector<VectorRecord> VectorStore::get_all() const {
        std::vector<VectorRecord> records;
        records.reserve(m_vectors.size());
        for (const auto& [id, vec] : m_vectors) {
            records.push_back({id, vec, m_metadata.at(id)});
        }
        return records;
    }

    json VectorStore::to_json() const {
        json vectors = json::object();
        json metadata = json::object();
        // JSON object keys must be strings.
        for (const auto& [id, vec] : m_vectors) {
            vectors[std::to_string(id)] = vec;
            metadata[std::to_string(id)] = m_metadata.at(id);
        }
        return {
            {"dimension", m_dimension},
            {"next_id", m_next_id},
            {"vectors", std::move(vectors)},
            {"metadata", std::move(metadata)}
        };
    }

    VectorStore VectorStore::from_json(const json& doc) {
        if (!doc.is_object()) throw CorruptData("document is not an object");

        const json& dim = require(doc, "dimension");
        const json& next = require(doc, "next_id");
        const json& vectors = require(doc, "vectors");
        const json& metadata = require(doc, "metadata");

        if (!dim.is_number_unsigned() || dim.get<std::uint64_t>() == 0)
            throw CorruptData("'dimension' must be a positive integer");
        if (!next.is_number_integer() || next.get<std::int64_t>() < 0)
            throw CorruptData("'next_id' must be a non-negative integer");
        if (!vectors.is_object()) throw CorruptData("'vectors' must be an object");
        if (!metadata.is_object()) throw CorruptData("'metadata' must be an object");
        if (vectors.size() != metadata.size())
            throw CorruptData("'vectors' and 'metadata' hold different id sets");

        VectorStore store(dim.get<size_t>());
        store.m_next_id = next.get<RecordId>();

        for (auto it = vectors.begin(); it != vectors.end(); ++it) {
            RecordId id = parse_id_key(it.key());
            if (id >= store.m_next_id)
                throw CorruptData("id " + it.key() + " is not below 'next_id'");

            auto meta = metadata.find(it.key());
            if (meta == metadata.end())
                throw CorruptData("id " + it.key() + " has a vector but no metadata");

            const json& values = it.value();
            if (!values.is_array() || values.size() != store.m_dimension)
                throw CorruptData("vector for id " + it.key() + " does not have "
                                  + std::to_string(store.m_dimension) + " elements");

            Vector vec;
            vec.reserve(values.size());
            for (const auto& v : values) {
                if (!v.is_number()) throw CorruptData("vector for id " + it.key() + " holds a non-numeric value");
                const double d = v.get<double>();
                if (!(std::fabs(d) <= std::numeric_limits<float>::max()))
                    throw CorruptData("vector for id " + it.key() + " holds a value outside the float range");
                vec.push_back(static_cast<float>(d));
            }

            store.m_vectors.emplace(id, std::move(vec));
            store.m_metadata.emplace(id, *meta);
        }
        return store;
    }

    void VectorStore::save(const std::filesystem::path& path) const {
        std::ofstream f(path, std::ios::out | std::ios::trunc);
        if (!f.is_open()) throw StorageError("cannot open " + path.string() + " for writing");

        f << to_json().dump();
        f.flush();
        if (!f) throw StorageError("failed writing " + path.string());
    }

    VectorStore VectorStore::load(const std::filesystem::path& path) {
        std::ifstream f(path);
        if (!f.is_open()) throw StorageError("cannot open " + path.string());

        json doc;
        try {
            doc = json::parse(f);
        } catch (const json::parse_error& e) {
            throw CorruptData(std::string("invalid JSON: ") + e.what());
        }

        try {
            return from_json(doc);
        } catch (const json::exception& e) {
            throw CorruptData(e.what());
        }
    }

}
