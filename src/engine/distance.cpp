#include "distance.hpp"
#include "plover/errors.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>

namespace plover::engine {

    namespace {

        void check_lengths(const Vector& a, const Vector& b) {
            if (a.size() != b.size()) throw DimensionMismatch(a.size(), b.size());
        }

        double dot(const Vector& a, const Vector& b) {
            double s = 0.0;
            for (size_t i = 0; i < a.size(); ++i) s += static_cast<double>(a[i]) * b[i];
            return s;
        }

        double norm(const Vector& a) {
            return std::sqrt(dot(a, a));
        }

    }

    bool all_finite(const Vector& v) {
        return std::all_of(v.begin(), v.end(), [](float x) { return std::isfinite(x); });
    }

    float cosine_distance(const Vector& a, const Vector& b) {
        check_lengths(a, b);
        return static_cast<float>(1.0 - dot(a, b) / (norm(a) * norm(b) + kCosineEpsilon));
    }

    float euclidean_distance(const Vector& a, const Vector& b) {
        check_lengths(a, b);
        double s = 0.0;
        for (size_t i = 0; i < a.size(); ++i) {
            const double d = static_cast<double>(a[i]) - b[i];
            s += d * d;
        }
        return static_cast<float>(std::sqrt(s));
    }

    float neg_dot_distance(const Vector& a, const Vector& b) {
        check_lengths(a, b);
        return static_cast<float>(-dot(a, b));
    }

    Metric parse_metric(const std::string& name) {
        std::string key = name;
        std::transform(key.begin(), key.end(), key.begin(), [](unsigned char c) { return std::tolower(c); });

        if (key == "cosine") return Metric::Cosine;
        if (key == "euclidean" || key == "l2") return Metric::Euclidean;
        if (key == "dot" || key == "neg_dot" || key == "negdot" || key == "inner_product") return Metric::NegDot;
        throw UnknownMetric(name);
    }

    std::string metric_name(Metric metric) {
        switch (metric) {
            case Metric::Cosine: return "cosine";
            case Metric::Euclidean: return "euclidean";
            case Metric::NegDot: return "dot";
        }
        return "cosine";
    }

    DistanceFn distance_function(Metric metric) {
        switch (metric) {
            case Metric::Cosine: return &cosine_distance;
            case Metric::Euclidean: return &euclidean_distance;
            case Metric::NegDot: return &neg_dot_distance;
        }
        return &cosine_distance;
    }

}
