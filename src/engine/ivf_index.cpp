#include "ivf_index.hpp"
#include "plover/errors.hpp"
#include <algorithm>
#include <iostream>
#include <numeric>
#include <stdexcept>

using json = nlohmann::json;

namespace plover::engine {

    json IndexStats::to_json() const {
        if (!built) return {{"built", false}};
        return {
            {"built", true},
            {"num_clusters", num_clusters},
            {"total_vectors", total_vectors},
            {"avg_cluster_size", avg_cluster_size},
            {"min_cluster_size", min_cluster_size},
            {"max_cluster_size", max_cluster_size},
            {"empty_clusters", empty_clusters},
            {"nprobe", nprobe},
            {"stale", stale}
        };
    }

    IVFIndex::IVFIndex(VectorStore& store, std::unique_ptr<Clusterer> clusterer, IndexOptions options)
        : m_store(store), m_clusterer(std::move(clusterer)), m_options(options) {
        if (!m_clusterer) throw std::invalid_argument("IVFIndex needs a clusterer");
        if (m_options.nprobe == 0) throw std::invalid_argument("nprobe must be at least 1");
        if (m_options.fallback_factor == 0) throw std::invalid_argument("fallback_factor must be at least 1");
    }

    void IVFIndex::build() {
        std::vector<RecordId> ids;
        std::vector<Vector> vectors;
        for (auto& rec : m_store.get_all()) {
            ids.push_back(rec.id);
            vectors.push_back(std::move(rec.vector));
        }
        if (ids.empty()) {
            // Nothing left to partition, so the old lists only hold dead ids.
            m_centroids.clear();
            m_lists.clear();
            m_assignment.clear();
            m_built = false;
            throw EmptyStore();
        }

        const size_t k = m_options.n_clusters ? m_options.n_clusters : default_cluster_count(ids.size());
        Clustering result = m_clusterer->cluster(vectors, k);

        if (result.centroids.empty()) throw ClusteringError("no centroids returned");
        if (result.assignment.size() != ids.size())
            throw ClusteringError("expected " + std::to_string(ids.size()) + " assignments, got "
                                  + std::to_string(result.assignment.size()));
        for (const auto& c : result.centroids) {
            if (c.size() != m_store.dimension())
                throw ClusteringError("centroid has dimension " + std::to_string(c.size()));
        }

        std::vector<std::vector<RecordId>> lists(result.centroids.size());
        std::unordered_map<RecordId, size_t> assignment;
        assignment.reserve(ids.size());
        for (size_t i = 0; i < ids.size(); ++i) {
            const size_t c = result.assignment[i];
            if (c >= lists.size())
                throw ClusteringError("cluster id " + std::to_string(c) + " out of range");
            lists[c].push_back(ids[i]);
            assignment.emplace(ids[i], c);
        }

        m_centroids = std::move(result.centroids);
        m_lists = std::move(lists);
        m_assignment = std::move(assignment);
        m_built = true;
        m_built_generation = m_store.generation();

        auto stats = get_stats();
        std::cerr << "[IVFIndex] Built " << stats.num_clusters << " clusters over " << stats.total_vectors
                  << " vectors (avg list size " << stats.avg_cluster_size
                  << ", max " << stats.max_cluster_size << ")\n";
    }

    std::vector<size_t> IVFIndex::rank_clusters(const Vector& query) const {
        DistanceFn fn = distance_function(m_options.shortlist_metric);
        std::vector<float> dists(m_centroids.size());
        for (size_t c = 0; c < m_centroids.size(); ++c) dists[c] = fn(query, m_centroids[c]);

        std::vector<size_t> order(m_centroids.size());
        std::iota(order.begin(), order.end(), 0);
        std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) { return dists[a] < dists[b]; });
        return order;
    }

    std::vector<SearchResult> IVFIndex::search(const Vector& query, size_t k) const {
        if (!m_built) throw IndexNotBuilt();
        if (k == 0) throw std::invalid_argument("k must be at least 1");
        if (query.size() != m_store.dimension()) throw DimensionMismatch(m_store.dimension(), query.size());
        if (!all_finite(query)) throw InvalidVector("query components must be finite");
        if (is_stale()) {
            std::cerr << "[IVFIndex] Warning: store changed since the last build, results may be incomplete.\n";
        }

        auto order = rank_clusters(query);

        std::vector<RecordId> candidates;
        auto take = [&](size_t cluster) {
            for (RecordId id : m_lists[cluster]) {
                // Skip ids removed from the store after the build.
                if (m_store.contains(id)) candidates.push_back(id);
            }
        };

        const size_t probe = std::min(m_options.nprobe, order.size());
        for (size_t i = 0; i < probe; ++i) take(order[i]);

        if (candidates.size() < k) {
            const size_t target = m_options.fallback_factor * k;
            for (size_t i = probe; i < order.size() && candidates.size() < target; ++i) take(order[i]);
        }

        DistanceFn fn = distance_function(m_options.metric);
        std::vector<SearchResult> results;
        results.reserve(candidates.size());
        for (RecordId id : candidates) {
            auto rec = m_store.get(id);
            float d = fn(query, rec.vector);
            results.push_back({id, d, std::move(rec.vector), std::move(rec.metadata)});
        }

        std::sort(results.begin(), results.end(), [](const SearchResult& a, const SearchResult& b) {
            if (a.distance != b.distance) return a.distance < b.distance;
            return a.id < b.id;
        });
        if (results.size() > k) results.resize(k);
        return results;
    }

    std::vector<RecordId> IVFIndex::add_vectors_bulk(const std::vector<Vector>& vectors,
                                                     const std::vector<json>& metadata) {
        if (!metadata.empty() && metadata.size() != vectors.size()) {
            throw std::invalid_argument("got " + std::to_string(vectors.size()) + " vectors but "
                                        + std::to_string(metadata.size()) + " metadata entries");
        }

        std::vector<RecordId> ids;
        ids.reserve(vectors.size());
        for (size_t i = 0; i < vectors.size(); ++i) {
            ids.push_back(m_store.add(vectors[i], metadata.empty() ? json::object() : metadata[i]));
        }
        build();
        return ids;
    }

    IndexStats IVFIndex::get_stats() const {
        IndexStats stats;
        if (!m_built) return stats;

        stats.built = true;
        stats.num_clusters = m_lists.size();
        stats.nprobe = m_options.nprobe;
        stats.stale = is_stale();
        stats.min_cluster_size = m_lists.empty() ? 0 : m_lists.front().size();
        for (const auto& list : m_lists) {
            stats.total_vectors += list.size();
            stats.min_cluster_size = std::min(stats.min_cluster_size, list.size());
            stats.max_cluster_size = std::max(stats.max_cluster_size, list.size());
            if (list.empty()) stats.empty_clusters++;
        }
        if (stats.num_clusters > 0) {
            stats.avg_cluster_size = static_cast<double>(stats.total_vectors) / static_cast<double>(stats.num_clusters);
        }
        return stats;
    }

    bool IVFIndex::is_stale() const {
        return m_built && m_store.generation() != m_built_generation;
    }

    std::optional<size_t> IVFIndex::cluster_of(RecordId id) const {
        auto it = m_assignment.find(id);
        if (it == m_assignment.end()) return std::nullopt;
        return it->second;
    }

    void IVFIndex::set_nprobe(size_t nprobe) {
        if (nprobe == 0) throw std::invalid_argument("nprobe must be at least 1");
        m_options.nprobe = nprobe;
    }

}
