//
// Created by opencode on 17/10/2026.
//

#include "wbvm/installation_tracker.hpp"
#include "wbvm/errors.hpp"

namespace wbvm {

    InstallationTracker::InstallationTracker(std::filesystem::path root_dir, std::string executable)
        : root_dir_(std::move(root_dir))
        , executable_(std::move(executable)) {}

    bool InstallationTracker::is_valid_version(const std::string& version) {
        if (version.empty() || version == "." || version == "..") {
            return false;
        }
        return version.find('/') == std::string::npos &&
               version.find('\\') == std::string::npos;
    }

    bool InstallationTracker::is_installed(const std::string& version) const {
        if (!is_valid_version(version)) {
            return false;
        }

        std::error_code ec;
        const auto dir = version_dir(version);
        if (!std::filesystem::is_directory(std::filesystem::symlink_status(dir, ec))) {
            return false;
        }

        return std::filesystem::is_regular_file(dir / executable_, ec);
    }

    std::set<std::string> InstallationTracker::list_installed() const {
        std::set<std::string> installed;

        std::error_code ec;
        std::filesystem::directory_iterator it(root_dir_, ec);
        if (ec) {
            return installed;
        }

        const std::filesystem::directory_iterator end;
        for (; it != end; it.increment(ec)) {
            const auto& entry = *it;
            std::error_code entry_ec;
            if (entry.is_symlink(entry_ec)) {
                continue;
            }
            std::string name = entry.path().filename().string();
            if (name.empty() || name[0] == '.') {
                continue;
            }
            if (is_installed(name)) {
                installed.insert(name);
            }
        }
        if (ec) {
            throw WbvmError(ErrorKind::FILESYSTEM_FAILED,
                            "Failed to read " + root_dir_.string() + ": " + ec.message());
        }

        return installed;
    }

} // namespace wbvm
