/**
 * @file installation_tracker.hpp
 * @brief Reconstructs installation state from the root directory
 * 
 * There is no install manifest. A version is installed iff
 *   <root>/<version>/           is a real directory (not a symlink), and
 *   <root>/<version>/<exe>      is a regular file.
 * 
 * Every call re-stats the filesystem; nothing is cached.
 */

#pragma once

#include <string>
#include <set>
#include <filesystem>

namespace wbvm {

    class InstallationTracker {
    public:
        /**
         * @param root_dir Root directory holding one directory per version
         * @param executable Name of the product executable, e.g. "worterbuch"
         */
        InstallationTracker(std::filesystem::path root_dir, std::string executable);

        /**
         * @brief Checks whether a version is installed
         * 
         * Directory-without-executable and executable-as-directory both
         * count as not installed. Versions that are empty, "." / "..", or
         * contain a path separator are never installed.
         * 
         * @param version Bare version string, e.g. "2.0.0"
         */
        [[nodiscard]] bool is_installed(const std::string& version) const;

        /**
         * @brief Lists installed versions
         * 
         * Scans immediate subdirectories of the root, skipping symlinks
         * (the `bin` alias) and hidden entries (the staging area).
         * 
         * @return std::set<std::string> Installed bare versions
         */
        [[nodiscard]] std::set<std::string> list_installed() const;

        /**
         * @brief Whether @p version can name a directory directly under the root
         */
        [[nodiscard]] static bool is_valid_version(const std::string& version);

        [[nodiscard]] std::filesystem::path version_dir(const std::string& version) const {
            return root_dir_ / version;
        }

        [[nodiscard]] const std::filesystem::path& get_root_dir() const { return root_dir_; }
        [[nodiscard]] const std::string& get_executable() const { return executable_; }

    private:
        std::filesystem::path root_dir_;
        std::string executable_;
    };

} // namespace wbvm
