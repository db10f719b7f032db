//
// Created by opencode on 17/10/2026.
//

#include "wbvm/activation_manager.hpp"
#include "wbvm/installation_tracker.hpp"
#include "wbvm/errors.hpp"

namespace wbvm {

    ActivationManager::ActivationManager(const InstallationTracker& tracker)
        : tracker_(tracker)
        , alias_path_(tracker.get_root_dir() / "bin") {}

    void ActivationManager::set_default(const std::string& version) {
        if (!tracker_.is_installed(version)) {
            throw WbvmError(ErrorKind::VERSION_NOT_INSTALLED,
                            "Version " + version + " is not installed, please install it first!");
        }

        remove_alias();

        std::error_code ec;
        auto target = std::filesystem::absolute(tracker_.version_dir(version), ec);
        if (!ec) {
            std::filesystem::create_directory_symlink(target, alias_path_, ec);
        }
        if (ec) {
            throw WbvmError(ErrorKind::FILESYSTEM_FAILED,
                            "Failed to create " + alias_path_.string() + ": " + ec.message());
        }
    }

    std::optional<std::string> ActivationManager::get_default() const {
        std::error_code ec;
        if (!std::filesystem::is_symlink(std::filesystem::symlink_status(alias_path_, ec))) {
            return std::nullopt;
        }

        std::filesystem::path target = std::filesystem::read_symlink(alias_path_, ec);
        if (ec) {
            return std::nullopt;
        }

        // "<root>/1.2.3/" has an empty filename
        std::string version = target.filename().string();
        if (version.empty()) {
            version = target.parent_path().filename().string();
        }

        if (!tracker_.is_installed(version)) {
            return std::nullopt;
        }
        if (!std::filesystem::equivalent(alias_path_, tracker_.version_dir(version), ec) || ec) {
            return std::nullopt;
        }
        return version;
    }

    void ActivationManager::remove_alias() {
        std::error_code ec;
        auto status = std::filesystem::symlink_status(alias_path_, ec);
        if (!std::filesystem::exists(status)) {
            return;
        }
        if (!std::filesystem::is_symlink(status)) {
            throw WbvmError(ErrorKind::FILESYSTEM_FAILED,
                            alias_path_.string() + " exists and is not a symlink, refusing to replace it");
        }

        std::filesystem::remove(alias_path_, ec);
        if (ec) {
            throw WbvmError(ErrorKind::FILESYSTEM_FAILED,
                            "Failed to remove " + alias_path_.string() + ": " + ec.message());
        }
    }

} // namespace wbvm
