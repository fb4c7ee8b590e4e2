#pragma once

#include <filesystem>

namespace plover::platform {

    /**
     * @brief System-level helper functions.
     */
    namespace system {
        /**
         * @brief $XDG_CONFIG_HOME/plover, or ~/.config/plover. Empty if neither is set.
         */
        std::filesystem::path get_config_dir();

        /**
         * @brief $XDG_DATA_HOME/plover, or ~/.local/share/plover. Empty if neither is set.
         */
        std::filesystem::path get_data_dir();
    }

}
