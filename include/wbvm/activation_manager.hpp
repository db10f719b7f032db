/**
 * @file activation_manager.hpp
 * @brief Maintains the `bin` alias pointing at the default version
 * 
 * The alias <root>/bin is a directory symlink to <root>/<version>. It is
 * either absent or points at an installed version; this class is its only
 * writer and checks installation before every write.
 * 
 * Switching is two filesystem operations (remove, then create). A crash in
 * between leaves no alias, never a wrong one.
 */

#pragma once

#include <string>
#include <optional>
#include <filesystem>

namespace wbvm {

    class InstallationTracker;

    class ActivationManager {
    public:
        explicit ActivationManager(const InstallationTracker& tracker);

        /**
         * @brief Points the alias at an installed version
         * 
         * @param version Bare version string
         * @throws WbvmError VERSION_NOT_INSTALLED if @p version is not
         *         installed; the existing alias is left untouched
         * @throws WbvmError FILESYSTEM_FAILED if the alias cannot be removed
         *         or created, or if `bin` exists but is not a symlink
         */
        void set_default(const std::string& version);

        /**
         * @brief Reads the current default version
         * 
         * @return std::optional<std::string> The version named by the alias
         *         target, or nullopt if the alias is absent, not a symlink,
         *         or points at something that is no longer installed
         */
        [[nodiscard]] std::optional<std::string> get_default() const;

        [[nodiscard]] const std::filesystem::path& get_alias_path() const { return alias_path_; }

    private:
        const InstallationTracker& tracker_;
        std::filesystem::path alias_path_;  ///< <root>/bin

        void remove_alias();
    };

} // namespace wbvm
