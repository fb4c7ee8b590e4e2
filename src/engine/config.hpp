#pragma once

#include <cstdint>
#include <cstdlib>
#include <string>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <nlohmann/json.hpp>
#include "plover/errors.hpp"
#include "distance.hpp"
#include "ivf_index.hpp"

namespace plover::engine {

    struct Config {
        std::string store_path = ""; // empty: <data dir>/store.json

        // Index
        std::string metric = "cosine";
        std::string shortlist_metric = "cosine";
        size_t nprobe = 1;
        size_t n_clusters = 0; // 0: one cluster per ten vectors
        size_t fallback_factor = 2;
        size_t kmeans_iterations = 25;
        std::uint64_t kmeans_seed = 42;

        // Embeddings
        std::string embedding_backend = "ollama"; // ollama, openai
        std::string embedding_model = "all-minilm";
        std::string embedding_endpoint = "http://localhost:11434/api/embeddings"; // for ollama
        std::string openai_key = "";
        std::string embedding_cache = ""; // SQLite path, empty disables caching

        /**
         * @brief Reads the config file, keeping defaults for absent keys.
         *
         * A missing file yields the defaults. OPENAI_API_KEY overrides openai_key.
         * @throws std::runtime_error if the file exists but is not valid JSON.
         * @throws UnknownMetric if a metric name is not recognized.
         */
        static Config load(const std::filesystem::path& path) {
            Config cfg;
            if (std::filesystem::exists(path)) {
                std::ifstream f(path);
                nlohmann::json j;
                try {
                    j = nlohmann::json::parse(f);
                } catch (const nlohmann::json::parse_error& e) {
                    throw std::runtime_error("invalid config " + path.string() + ": " + e.what());
                }
                cfg = from_json(j);
            }
            if (const char* key = std::getenv("OPENAI_API_KEY")) cfg.openai_key = key;
            cfg.validate();
            return cfg;
        }

        // get<size_t>() would wrap a negative number instead of failing.
        static std::uint64_t unsigned_field(const nlohmann::json& j, const char* name) {
            const auto& v = j.at(name);
            if (!v.is_number_unsigned())
                throw std::runtime_error(std::string("invalid config value: '") + name + "' must be a non-negative integer");
            return v.get<std::uint64_t>();
        }

        static Config from_json(const nlohmann::json& j) {
            Config cfg;
            try {
                if (j.contains("store_path")) cfg.store_path = j["store_path"].get<std::string>();
                if (j.contains("metric")) cfg.metric = j["metric"].get<std::string>();
                if (j.contains("shortlist_metric")) cfg.shortlist_metric = j["shortlist_metric"].get<std::string>();
                if (j.contains("nprobe")) cfg.nprobe = unsigned_field(j, "nprobe");
                if (j.contains("n_clusters")) cfg.n_clusters = unsigned_field(j, "n_clusters");
                if (j.contains("fallback_factor")) cfg.fallback_factor = unsigned_field(j, "fallback_factor");
                if (j.contains("kmeans_iterations")) cfg.kmeans_iterations = unsigned_field(j, "kmeans_iterations");
                if (j.contains("kmeans_seed")) cfg.kmeans_seed = unsigned_field(j, "kmeans_seed");
                if (j.contains("embedding_backend")) cfg.embedding_backend = j["embedding_backend"].get<std::string>();
                if (j.contains("embedding_model")) cfg.embedding_model = j["embedding_model"].get<std::string>();
                if (j.contains("embedding_endpoint")) cfg.embedding_endpoint = j["embedding_endpoint"].get<std::string>();
                if (j.contains("openai_key")) cfg.openai_key = j["openai_key"].get<std::string>();
                if (j.contains("embedding_cache")) cfg.embedding_cache = j["embedding_cache"].get<std::string>();
            } catch (const nlohmann::json::type_error& e) {
                throw std::runtime_error(std::string("invalid config value: ") + e.what());
            }
            return cfg;
        }

        nlohmann::json to_json() const {
            nlohmann::json j;
            j["store_path"] = store_path;
            j["metric"] = metric;
            j["shortlist_metric"] = shortlist_metric;
            j["nprobe"] = nprobe;
            j["n_clusters"] = n_clusters;
            j["fallback_factor"] = fallback_factor;
            j["kmeans_iterations"] = kmeans_iterations;
            j["kmeans_seed"] = kmeans_seed;
            j["embedding_backend"] = embedding_backend;
            j["embedding_model"] = embedding_model;
            j["embedding_endpoint"] = embedding_endpoint;
            if (!openai_key.empty()) j["openai_key"] = openai_key;
            j["embedding_cache"] = embedding_cache;
            return j;
        }

        void save(const std::filesystem::path& path) const {
            std::ofstream f(path);
            if (!f.is_open()) throw StorageError("cannot open " + path.string() + " for writing");
            f << to_json().dump(4);
        }

        void validate() const {
            parse_metric(metric);
            parse_metric(shortlist_metric);
            if (nprobe == 0) throw std::invalid_argument("config: nprobe must be at least 1");
            if (fallback_factor == 0) throw std::invalid_argument("config: fallback_factor must be at least 1");
            if (embedding_backend != "ollama" && embedding_backend != "openai")
                throw std::invalid_argument("config: unknown embedding_backend '" + embedding_backend + "'");
        }

        IndexOptions index_options() const {
            IndexOptions opts;
            opts.nprobe = nprobe;
            opts.metric = parse_metric(metric);
            opts.shortlist_metric = parse_metric(shortlist_metric);
            opts.n_clusters = n_clusters;
            opts.fallback_factor = fallback_factor;
            return opts;
        }
    };

}
