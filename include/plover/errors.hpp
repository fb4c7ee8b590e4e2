#pragma once
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace plover {

    /**
     * @brief Base class for every error raised by the engine.
     */
    class Error : public std::runtime_error {
    public:
        explicit Error(const std::string& what) : std::runtime_error(what) {}
    };

    class DimensionMismatch : public Error {
    public:
        DimensionMismatch(size_t expected, size_t actual)
            : Error("dimension mismatch: expected " + std::to_string(expected) + ", got " + std::to_string(actual)),
              m_expected(expected), m_actual(actual) {}

        size_t expected() const { return m_expected; }
        size_t actual() const { return m_actual; }

    private:
        size_t m_expected;
        size_t m_actual;
    };

    /**
     * @brief Vector holds a NaN or infinite component.
     */
    class InvalidVector : public Error {
    public:
        explicit InvalidVector(const std::string& what) : Error("invalid vector: " + what) {}
    };

    class NotFound : public Error {
    public:
        explicit NotFound(std::int64_t id) : Error("record not found: " + std::to_string(id)), m_id(id) {}
        std::int64_t id() const { return m_id; }

    private:
        std::int64_t m_id;
    };

    class EmptyStore : public Error {
    public:
        EmptyStore() : Error("cannot build index: store is empty") {}
    };

    class IndexNotBuilt : public Error {
    public:
        IndexNotBuilt() : Error("index has not been built") {}
    };

    class CorruptData : public Error {
    public:
        explicit CorruptData(const std::string& what) : Error("corrupt data: " + what) {}
    };

    class UnknownMetric : public Error {
    public:
        explicit UnknownMetric(const std::string& name) : Error("unknown distance metric: " + name) {}
    };

    /**
     * @brief File could not be opened or written.
     */
    class StorageError : public Error {
    public:
        explicit StorageError(const std::string& what) : Error(what) {}
    };

    /**
     * @brief Clusterer output violated its contract.
     */
    class ClusteringError : public Error {
    public:
        explicit ClusteringError(const std::string& what) : Error("clustering failed: " + what) {}
    };

    class EmbeddingError : public Error {
    public:
        explicit EmbeddingError(const std::string& what) : Error(what) {}
    };

    class RateLimited : public EmbeddingError {
    public:
        explicit RateLimited(const std::string& what) : EmbeddingError(what) {}
    };

}
