#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>
#include "plover/types.hpp"
#include "clusterer.hpp"
#include "distance.hpp"
#include "vector_store.hpp"

namespace plover::engine {

    struct IndexOptions {
        size_t nprobe = 1;
        Metric metric = Metric::Cosine;          // ranks candidates
        Metric shortlist_metric = Metric::Cosine; // ranks centroids
        size_t n_clusters = 0;                    // 0 = default_cluster_count(n)
        size_t fallback_factor = 2;               // candidate target is fallback_factor * k
    };

    struct IndexStats {
        bool built = false;
        size_t num_clusters = 0;
        size_t total_vectors = 0;
        double avg_cluster_size = 0.0;
        size_t min_cluster_size = 0;
        size_t max_cluster_size = 0;
        size_t empty_clusters = 0;
        size_t nprobe = 0;
        bool stale = false;

        nlohmann::json to_json() const;
    };

    /**
     * @brief Inverted-file index over a VectorStore.
     *
     * The store is borrowed, not copied: it must outlive the index, and any
     * mutation after build() leaves the partition stale until the next
     * build(). is_stale() reports that condition but nothing acts on it.
     */
    class IVFIndex {
    public:
        IVFIndex(VectorStore& store, std::unique_ptr<Clusterer> clusterer, IndexOptions options = {});

        /**
         * @brief Clusters a full snapshot of the store and replaces the partition.
         * @throws EmptyStore if the store holds no records; the index is left unbuilt.
         * @throws ClusteringError if the clusterer output is inconsistent; any
         *         previous partition is kept.
         */
        void build();

        /**
         * @brief Approximate top-k search.
         *
         * Probes the nprobe clusters whose centroids are nearest to the query,
         * widening to further clusters while fewer than k candidates were found.
         * @return Up to k results, nearest first.
         * @throws IndexNotBuilt before the first successful build().
         */
        std::vector<SearchResult> search(const Vector& query, size_t k) const;

        /**
         * @brief Adds every vector to the store, then rebuilds from scratch.
         *
         * Records added before a failure stay in the store.
         */
        std::vector<RecordId> add_vectors_bulk(const std::vector<Vector>& vectors,
                                               const std::vector<nlohmann::json>& metadata = {});

        IndexStats get_stats() const;

        bool is_built() const { return m_built; }
        bool is_stale() const;

        const std::vector<Vector>& centroids() const { return m_centroids; }
        const std::vector<std::vector<RecordId>>& inverted_lists() const { return m_lists; }
        std::optional<size_t> cluster_of(RecordId id) const;

        const IndexOptions& options() const { return m_options; }
        void set_nprobe(size_t nprobe);

    private:
        VectorStore& m_store;
        std::unique_ptr<Clusterer> m_clusterer;
        IndexOptions m_options;

        bool m_built = false;
        std::uint64_t m_built_generation = 0;
        std::vector<Vector> m_centroids;
        std::vector<std::vector<RecordId>> m_lists;
        std::unordered_map<RecordId, size_t> m_assignment;

        std::vector<size_t> rank_clusters(const Vector& query) const;
    };

}
