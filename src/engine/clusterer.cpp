#include "clusterer.hpp"
#include "plover/errors.hpp"
#include <algorithm>
#include <limits>
#include <random>
#include <stdexcept>

namespace plover::engine {

    namespace {

        double dist_sq(const Vector& a, const Vector& b) {
            double s = 0.0;
            for (size_t i = 0; i < a.size(); ++i) {
                const double d = static_cast<double>(a[i]) - b[i];
                s += d * d;
            }
            return s;
        }

        size_t nearest(const Vector& v, const std::vector<Vector>& centroids) {
            size_t best = 0;
            double best_d = std::numeric_limits<double>::max();
            for (size_t c = 0; c < centroids.size(); ++c) {
                const double d = dist_sq(v, centroids[c]);
                if (d < best_d) {
                    best_d = d;
                    best = c;
                }
            }
            return best;
        }

    }

    KMeansClusterer::KMeansClusterer(size_t max_iterations, std::uint64_t seed)
        : m_max_iterations(max_iterations), m_seed(seed) {}

    Clustering KMeansClusterer::cluster(const std::vector<Vector>& vectors, size_t k) {
        if (vectors.empty()) throw std::invalid_argument("k-means needs at least one vector");
        if (k == 0) throw std::invalid_argument("k-means needs k >= 1");

        const size_t n = vectors.size();
        const size_t dim = vectors.front().size();
        for (const auto& v : vectors) {
            if (v.size() != dim) throw DimensionMismatch(dim, v.size());
        }
        k = std::min(k, n);

        std::mt19937_64 rng(m_seed);
        std::uniform_int_distribution<size_t> uni(0, n - 1);

        // k-means++ seeding
        std::vector<size_t> chosen;
        chosen.reserve(k);
        chosen.push_back(uni(rng));
        std::vector<double> d2(n, std::numeric_limits<double>::max());

        while (chosen.size() < k) {
            const Vector& last = vectors[chosen.back()];
            double total = 0.0;
            for (size_t i = 0; i < n; ++i) {
                d2[i] = std::min(d2[i], dist_sq(vectors[i], last));
                total += d2[i];
            }
            if (total <= 0.0) {
                // Every remaining point coincides with a chosen seed.
                chosen.push_back(uni(rng));
                continue;
            }
            std::uniform_real_distribution<double> pick(0.0, total);
            double r = pick(rng);
            size_t next = n - 1;
            for (size_t i = 0; i < n; ++i) {
                r -= d2[i];
                if (r <= 0.0) {
                    next = i;
                    break;
                }
            }
            chosen.push_back(next);
        }

        Clustering out;
        out.centroids.reserve(k);
        for (size_t idx : chosen) out.centroids.push_back(vectors[idx]);
        out.assignment.assign(n, 0);
        for (size_t i = 0; i < n; ++i) out.assignment[i] = nearest(vectors[i], out.centroids);

        for (size_t iter = 0; iter < m_max_iterations; ++iter) {
            std::vector<std::vector<double>> sums(k, std::vector<double>(dim, 0.0));
            std::vector<size_t> counts(k, 0);
            for (size_t i = 0; i < n; ++i) {
                const size_t c = out.assignment[i];
                counts[c]++;
                for (size_t d = 0; d < dim; ++d) sums[c][d] += vectors[i][d];
            }
            for (size_t c = 0; c < k; ++c) {
                if (counts[c] == 0) continue;
                for (size_t d = 0; d < dim; ++d) {
                    out.centroids[c][d] = static_cast<float>(sums[c][d] / static_cast<double>(counts[c]));
                }
            }

            bool changed = false;
            for (size_t i = 0; i < n; ++i) {
                const size_t c = nearest(vectors[i], out.centroids);
                if (c != out.assignment[i]) {
                    out.assignment[i] = c;
                    changed = true;
                }
            }
            if (!changed) break;
        }
        return out;
    }

    std::unique_ptr<Clusterer> create_kmeans_clusterer(size_t max_iterations, std::uint64_t seed) {
        return std::make_unique<KMeansClusterer>(max_iterations, seed);
    }

}
