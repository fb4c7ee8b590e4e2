#pragma once

#include <cstdint>
#include <memory>
#include <vector>
#include "plover/types.hpp"

namespace plover::engine {

    struct Clustering {
        std::vector<Vector> centroids;
        // One entry per input vector, each in [0, centroids.size()).
        std::vector<size_t> assignment;
    };

    /**
     * @brief Abstract base class for the clustering step of an index build.
     */
    class Clusterer {
    public:
        virtual ~Clusterer() = default;

        /**
         * @brief Partitions vectors into at most k clusters.
         * @param vectors Input matrix, all rows of the same dimension.
         * @param k Requested cluster count.
         */
        virtual Clustering cluster(const std::vector<Vector>& vectors, size_t k) = 0;
    };

    /**
     * @brief One cluster per ten vectors, at least one.
     */
    inline size_t default_cluster_count(size_t n) { return n / 10 + 1; }

    /**
     * @brief Lloyd's k-means in squared L2 with k-means++ seeding.
     *
     * k is clamped to the number of inputs. Empty clusters keep their previous
     * centroid. Output is fully determined by the seed.
     */
    class KMeansClusterer : public Clusterer {
    public:
        explicit KMeansClusterer(size_t max_iterations = 25, std::uint64_t seed = 42);

        Clustering cluster(const std::vector<Vector>& vectors, size_t k) override;

    private:
        size_t m_max_iterations;
        std::uint64_t m_seed;
    };

    std::unique_ptr<Clusterer> create_kmeans_clusterer(size_t max_iterations = 25, std::uint64_t seed = 42);

}
