#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace plover {

    using Vector = std::vector<float>;
    using RecordId = std::int64_t;

    struct VectorRecord {
        RecordId id;
        Vector vector;
        nlohmann::json metadata;
    };

    struct SearchResult {
        RecordId id;
        float distance;
        Vector vector;
        nlohmann::json metadata;
    };

}
