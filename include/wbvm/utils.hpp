/**
 * @file utils.hpp
 * @brief Utility functions for path expansion and filesystem layout
 *
 * This header provides helper functions for:
 * - Expanding tilde (~) to user's home directory
 * - Locating the wbvm root directory (~/.wbvm or $WBVM_ROOT)
 * - Naming the product executable for the current host
 */

#pragma once

#include <string>
#include <filesystem>
#include <cstdlib>
#include <iostream>

namespace wbvm {

    /**
     * @brief Expands a tilde (~) in a path to the user's home directory
     *
     * Examples:
     *   "~/.wbvm"        → "/home/username/.wbvm"
     *   "/absolute/path" → "/absolute/path" (unchanged)
     *   "relative/path"  → "relative/path" (unchanged)
     *
     * @param path The path string that may contain a tilde
     * @return std::filesystem::path The expanded path
     *
     * @note Falls back to USERPROFILE when HOME is unset. If neither is set,
     *       returns the original path.
     */
    inline std::filesystem::path expand_tilde(const std::string& path) {
        if (path.empty() || path[0] != '~') {
            return path;
        }

        const char* home = std::getenv("HOME");
        if (!home) {
            home = std::getenv("USERPROFILE");  // Windows fallback
        }
        if (!home) {
            std::cerr << "HOME environment variable not set" << std::endl;
            return path;
        }

        // Skip "~/" to avoid treating the rest as an absolute path
        std::string rest = path.substr(1);
        if (!rest.empty() && rest[0] == '/') {
            rest = rest.substr(1);
        }

        return std::filesystem::path(home) / rest;
    }

    /**
     * @brief Gets the wbvm root directory path
     *
     * Returns $WBVM_ROOT when set and non-empty, otherwise ~/.wbvm.
     * The root holds releases.json, one directory per installed version,
     * the `bin` alias, the staging area and the audit log.
     *
     * @return std::filesystem::path Path to the root directory
     */
    inline std::filesystem::path get_wbvm_dir() {
        const char* override_root = std::getenv("WBVM_ROOT");
        if (override_root && *override_root) {
            return expand_tilde(override_root);
        }
        return expand_tilde("~/.wbvm");
    }

    /**
     * @brief Name of the product executable inside a version directory
     *
     * @param product Product name, e.g. "worterbuch"
     * @return std::string "worterbuch" or "worterbuch.exe" on Windows
     */
    inline std::string executable_name(const std::string& product) {
#if defined(_WIN32)
        return product + ".exe";
#else
        return product;
#endif
    }

} // namespace wbvm
