/**
 * @file config_manager.hpp
 * @brief Loads wbvm settings
 * 
 * Settings come from three layers, later layers winning:
 * 1. Built-in defaults (worterbuch releases on GitHub)
 * 2. <root>/config.json (optional)
 * 3. Environment variables WBVM_RELEASES_URL and WBVM_PLATFORM
 * 
 * The root directory itself is chosen before any file can be read, so it
 * is only configurable through WBVM_ROOT (see get_wbvm_dir()).
 * 
 * Example config.json:
 *   {
 *     "product": "worterbuch",
 *     "release_index_url": "https://api.github.com/repos/babymotte/worterbuch/releases",
 *     "platform": "linux-x64"
 *   }
 */

#pragma once

#include <string>
#include <optional>
#include <filesystem>

namespace wbvm {

    inline constexpr const char* DEFAULT_PRODUCT = "worterbuch";
    inline constexpr const char* DEFAULT_RELEASE_INDEX_URL =
        "https://api.github.com/repos/babymotte/worterbuch/releases";

    /**
     * @brief Effective configuration for one invocation
     */
    struct Settings {
        std::filesystem::path root_dir;                 ///< ~/.wbvm
        std::string product = DEFAULT_PRODUCT;          ///< Executable and asset prefix
        std::string release_index_url = DEFAULT_RELEASE_INDEX_URL;
        std::optional<std::string> platform_override;   ///< Replaces host detection
    };

    /**
     * @brief Reads config.json and environment overrides for a root directory
     * 
     * Usage:
     *   ConfigManager cm(get_wbvm_dir());
     *   Settings settings = cm.load();
     */
    class ConfigManager {
    public:
        explicit ConfigManager(std::filesystem::path root_dir);

        /**
         * @brief Builds the effective settings
         * 
         * @return Settings Defaults overlaid with config.json and environment
         * @throws WbvmError CONFIG_INVALID if config.json is unreadable, not a
         *         JSON object, or holds a non-string value for a known key
         */
        [[nodiscard]] Settings load() const;

    private:
        std::filesystem::path root_dir_;
        std::filesystem::path config_path_;   ///< <root>/config.json

        void apply_file(Settings& settings) const;
        static void apply_environment(Settings& settings);
    };

} // namespace wbvm
