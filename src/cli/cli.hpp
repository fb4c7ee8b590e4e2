#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include "plover/types.hpp"

namespace plover::cli {

    class UsageError : public std::invalid_argument {
    public:
        explicit UsageError(const std::string& what) : std::invalid_argument(what) {}
    };

    struct Args {
        std::string command;
        std::vector<std::string> positional;
        std::string config_path; // empty: <config dir>/config.json
        std::string store_path;  // empty: from config
        std::string metadata;    // raw JSON given with --meta
        size_t k = 5;
        std::optional<size_t> nprobe;
        std::optional<std::string> metric;
    };

    extern const char* const kUsage;

    /**
     * @throws UsageError on unknown commands, unknown flags or missing values.
     */
    Args parse_args(int argc, const char* const* argv);

    /**
     * @brief Parses "0.1,0.2,0.3" into a vector.
     * @throws UsageError if any component is not a number.
     */
    Vector parse_vector(const std::string& text);

    /**
     * @brief Executes the command. Returns the process exit code.
     */
    int run(const Args& args);

}
