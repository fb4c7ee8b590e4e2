#pragma once

#include <string>
#include "plover/types.hpp"

namespace plover::engine {

    /**
     * @brief Dissimilarity measures. Lower always means more similar.
     */
    enum class Metric {
        Cosine,    // 1 - cos(a, b)
        Euclidean, // ||a - b||
        NegDot     // -(a . b), for pre-normalized vectors
    };

    using DistanceFn = float (*)(const Vector&, const Vector&);

    constexpr double kCosineEpsilon = 1e-8;

    float cosine_distance(const Vector& a, const Vector& b);
    float euclidean_distance(const Vector& a, const Vector& b);
    float neg_dot_distance(const Vector& a, const Vector& b);

    /**
     * @brief False if any component is NaN or infinite.
     */
    bool all_finite(const Vector& v);

    /**
     * @brief Resolves a metric name ("cosine", "euclidean"/"l2", "dot"/"neg_dot").
     * @throws UnknownMetric for anything else.
     */
    Metric parse_metric(const std::string& name);

    /**
     * @brief Canonical name, accepted back by parse_metric().
     */
    std::string metric_name(Metric metric);

    DistanceFn distance_function(Metric metric);

    inline float distance(Metric metric, const Vector& a, const Vector& b) {
        return distance_function(metric)(a, b);
    }

}
