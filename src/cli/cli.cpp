#include "cli.hpp"
#include "platform.hpp"
#include "engine/config.hpp"
#include "engine/embedder.hpp"
#include "engine/ivf_index.hpp"
#include "engine/vector_store.hpp"
#include "plover/errors.hpp"
#include <nlohmann/json.hpp>
#include <cctype>
#include <cmath>
#include <filesystem>
#include <iostream>
#include <sstream>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace plover::cli {

    const char* const kUsage =
        "Usage: plover [--config path] [--store path] <command> [args...]\n"
        "Commands:\n"
        "  init <dim>                         - Create an empty store\n"
        "  add <text> [--meta json]           - Embed text and store it\n"
        "  add-vector <v1,v2,...> [--meta json] - Store a raw vector\n"
        "  get <id>                           - Print a record\n"
        "  delete <id>                        - Remove a record\n"
        "  search <text> [-k N]               - Nearest records to the text\n"
        "  search-vector <v1,v2,...> [-k N]   - Nearest records to the vector\n"
        "  stats                              - Build the index and print statistics\n"
        "Options: --nprobe N, --metric cosine|euclidean|dot\n";

    namespace {

        struct CommandSpec {
            const char* name;
            size_t positional;
        };

        const CommandSpec kCommands[] = {
            {"init", 1}, {"add", 1}, {"add-vector", 1}, {"get", 1}, {"delete", 1},
            {"search", 1}, {"search-vector", 1}, {"stats", 0},
        };

        size_t parse_count(const std::string& flag, const std::string& value) {
            size_t pos = 0;
            unsigned long long n = 0;
            try {
                n = std::stoull(value, &pos);
            } catch (const std::exception&) {
                throw UsageError("invalid value for " + flag + ": " + value);
            }
            if (pos != value.size() || value[0] == '-' || n == 0) throw UsageError("invalid value for " + flag + ": " + value);
            return static_cast<size_t>(n);
        }

        RecordId parse_id(const std::string& value) {
            size_t pos = 0;
            long long id = -1;
            try {
                id = std::stoll(value, &pos);
            } catch (const std::exception&) {
                throw UsageError("invalid id: " + value);
            }
            if (pos != value.size() || id < 0) throw UsageError("invalid id: " + value);
            return id;
        }

        json record_json(RecordId id, const Vector& vec, const json& meta) {
            return {{"id", id}, {"vector", vec}, {"metadata", meta}};
        }

        class Session {
        public:
            explicit Session(const Args& args) : m_args(args) {
                fs::path config_path = args.config_path;
                if (config_path.empty()) config_path = platform::system::get_config_dir() / "config.json";
                m_config = engine::Config::load(config_path);

                if (args.nprobe) m_config.nprobe = *args.nprobe;
                if (args.metric) m_config.metric = *args.metric;
                m_config.validate();

                m_store_path = args.store_path;
                if (m_store_path.empty()) m_store_path = m_config.store_path;
                if (m_store_path.empty()) {
                    fs::path data_dir = platform::system::get_data_dir();
                    if (data_dir.empty()) data_dir = fs::current_path();
                    m_store_path = data_dir / "store.json";
                }
            }

            json metadata_or(json fallback) const {
                if (m_args.metadata.empty()) return fallback;
                try {
                    return json::parse(m_args.metadata);
                } catch (const json::parse_error& e) {
                    throw UsageError(std::string("--meta is not valid JSON: ") + e.what());
                }
            }

            engine::VectorStore load_store() const {
                return engine::VectorStore::load(m_store_path);
            }

            void save_store(const engine::VectorStore& store) const {
                store.save(m_store_path);
            }

            std::unique_ptr<engine::IVFIndex> build_index(engine::VectorStore& store) const {
                auto index = std::make_unique<engine::IVFIndex>(
                    store,
                    engine::create_kmeans_clusterer(m_config.kmeans_iterations, m_config.kmeans_seed),
                    m_config.index_options());
                index->build();
                return index;
            }

            Vector embed(const std::string& text) const {
                auto embedder = engine::create_embedder(m_config);
                return embedder->embed(text);
            }

            const fs::path& store_path() const { return m_store_path; }

        private:
            const Args& m_args;
            engine::Config m_config;
            fs::path m_store_path;
        };

        int print_results(const std::vector<SearchResult>& results) {
            json out = json::array();
            for (const auto& r : results) {
                out.push_back({{"id", r.id}, {"distance", r.distance}, {"metadata", r.metadata}});
            }
            std::cout << out.dump(2) << "\n";
            return 0;
        }

        int execute(const Args& args) {
            Session session(args);
            const std::string& cmd = args.command;

            if (cmd == "init") {
                if (fs::exists(session.store_path())) {
                    std::cerr << "[Plover] Store already exists: " << session.store_path() << "\n";
                    return 1;
                }
                if (session.store_path().has_parent_path()) fs::create_directories(session.store_path().parent_path());
                engine::VectorStore store(parse_count("<dim>", args.positional[0]));
                session.save_store(store);
                std::cout << "[Plover] Created store (dimension " << store.dimension() << "): "
                          << session.store_path() << "\n";
                return 0;
            }

            auto store = session.load_store();

            if (cmd == "add" || cmd == "add-vector") {
                const std::string& input = args.positional[0];
                Vector vec = (cmd == "add") ? session.embed(input) : parse_vector(input);
                json meta = session.metadata_or(cmd == "add" ? json{{"text", input}} : json::object());
                RecordId id = store.add(vec, meta);
                session.save_store(store);
                std::cout << json{{"id", id}}.dump() << "\n";
                return 0;
            }
            if (cmd == "get") {
                auto rec = store.get(parse_id(args.positional[0]));
                std::cout << record_json(rec.id, rec.vector, rec.metadata).dump(2) << "\n";
                return 0;
            }
            if (cmd == "delete") {
                bool removed = store.remove(parse_id(args.positional[0]));
                if (removed) session.save_store(store);
                std::cout << json{{"removed", removed}}.dump() << "\n";
                return removed ? 0 : 1;
            }
            if (cmd == "search" || cmd == "search-vector") {
                const std::string& input = args.positional[0];
                Vector query = (cmd == "search") ? session.embed(input) : parse_vector(input);
                auto index = session.build_index(store);
                return print_results(index->search(query, args.k));
            }
            if (cmd == "stats") {
                auto index = session.build_index(store);
                json out = {
                    {"store", {{"path", session.store_path().string()}, {"dimension", store.dimension()},
                               {"records", store.size()}, {"next_id", store.next_id()}}},
                    {"index", index->get_stats().to_json()}
                };
                std::cout << out.dump(2) << "\n";
                return 0;
            }
            throw UsageError("unknown command: " + cmd);
        }

    }

    Args parse_args(int argc, const char* const* argv) {
        Args a;
        int i = 1;
        auto next = [&](const std::string& flag) -> std::string {
            if (i >= argc) throw UsageError("missing value after " + flag);
            return argv[i++];
        };

        while (i < argc) {
            std::string arg = argv[i++];
            if (arg == "--config") a.config_path = next(arg);
            else if (arg == "--store") a.store_path = next(arg);
            else if (arg == "--meta") a.metadata = next(arg);
            else if (arg == "-k") a.k = parse_count(arg, next(arg));
            else if (arg == "--nprobe") a.nprobe = parse_count(arg, next(arg));
            else if (arg == "--metric") a.metric = next(arg);
            else if (arg.size() > 1 && arg[0] == '-' && (arg[1] < '0' || arg[1] > '9') && arg[1] != '.')
                throw UsageError("unknown flag: " + arg);
            else if (a.command.empty()) a.command = arg;
            else a.positional.push_back(arg);
        }

        if (a.command.empty()) throw UsageError("missing command");
        for (const auto& spec : kCommands) {
            if (a.command != spec.name) continue;
            if (a.positional.size() != spec.positional) {
                throw UsageError(a.command + " expects " + std::to_string(spec.positional) + " argument(s)");
            }
            return a;
        }
        throw UsageError("unknown command: " + a.command);
    }

    Vector parse_vector(const std::string& text) {
        Vector vec;
        std::stringstream ss(text);
        std::string item;
        while (std::getline(ss, item, ',')) {
            size_t pos = 0;
            float value = 0.0f;
            try {
                value = std::stof(item, &pos);
            } catch (const std::exception&) {
                throw UsageError("not a number: '" + item + "'");
            }
            while (pos < item.size() && std::isspace(static_cast<unsigned char>(item[pos]))) ++pos;
            if (pos != item.size()) throw UsageError("not a number: '" + item + "'");
            if (!std::isfinite(value)) throw UsageError("not a finite number: '" + item + "'");
            vec.push_back(value);
        }
        if (vec.empty()) throw UsageError("empty vector");
        return vec;
    }

    int run(const Args& args) {
        try {
            return execute(args);
        } catch (const UsageError& e) {
            std::cerr << "Error: " << e.what() << "\n" << kUsage;
            return 1;
        } catch (const std::exception& e) {
            std::cerr << "[Plover] Error: " << e.what() << "\n";
            return 1;
        }
    }

}
