#include "platform.hpp"
#include <cstdlib>

namespace plover::platform {

    namespace {
        std::filesystem::path xdg_dir(const char* xdg_var, const char* home_suffix) {
            const char* xdg = std::getenv(xdg_var);
            if (xdg && *xdg) return std::filesystem::path(xdg) / "plover";
            const char* home = std::getenv("HOME");
            return home ? std::filesystem::path(home) / home_suffix / "plover" : std::filesystem::path();
        }
    }

    namespace system {
        std::filesystem::path get_config_dir() {
            return xdg_dir("XDG_CONFIG_HOME", ".config");
        }
        std::filesystem::path get_data_dir() {
            return xdg_dir("XDG_DATA_HOME", ".local/share");
        }
    }

}
