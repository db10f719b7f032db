//
// Created by opencode on 17/10/2026.
//

#include "wbvm/acquisition_pipeline.hpp"
#include "wbvm/installation_tracker.hpp"
#include "wbvm/errors.hpp"
#include <cpr/cpr.h>
#include <cstdlib>
#include <fstream>

namespace wbvm {

    namespace {

        [[noreturn]] void fs_failure(const std::string& what, const std::filesystem::path& path,
                                     const std::error_code& ec) {
            throw WbvmError(ErrorKind::FILESYSTEM_FAILED,
                            "Failed to " + what + " " + path.string() + ": " + ec.message());
        }

        // Paths are interpolated into a double-quoted shell command
        bool is_shell_safe(const std::filesystem::path& path) {
            return path.string().find_first_of("\"`$\\") == std::string::npos;
        }

    } // namespace

    void CprFileFetcher::fetch(const std::string& url, const std::filesystem::path& destination) {
        cpr::Response response = cpr::Get(cpr::Url{url},
                                          cpr::Redirect(true));

        if (response.error) {
            throw WbvmError(ErrorKind::FETCH_FAILED,
                            "Download of " + url + " failed: " + response.error.message);
        }
        if (response.status_code != 200) {
            throw WbvmError(ErrorKind::FETCH_FAILED,
                            "Download of " + url + " failed with status: " +
                            std::to_string(response.status_code));
        }

        std::ofstream file(destination, std::ios::binary | std::ios::trunc);
        if (!file) {
            throw WbvmError(ErrorKind::FILESYSTEM_FAILED,
                            "Failed to open destination file: " + destination.string());
        }

        file.write(response.text.data(), static_cast<std::streamsize>(response.text.size()));
        file.close();
        if (!file) {
            throw WbvmError(ErrorKind::FILESYSTEM_FAILED,
                            "Failed to write destination file: " + destination.string());
        }
    }

    void SystemArchiveExtractor::extract(const std::filesystem::path& archive_path,
                                         const std::filesystem::path& extract_dir) {
        for (const auto* path : {&archive_path, &extract_dir}) {
            if (!is_shell_safe(*path)) {
                throw WbvmError(ErrorKind::EXTRACT_FAILED,
                                "Refusing to extract, path contains shell metacharacters: " + path->string());
            }
        }

        std::error_code ec;
        std::filesystem::create_directories(extract_dir, ec);
        if (ec) {
            fs_failure("create", extract_dir, ec);
        }

#if defined(_WIN32)
        std::string cmd = "tar -xf \"" + archive_path.string() + "\" -C \"" +
                          extract_dir.string() + "\"";
#else
        std::string cmd = "unzip -o -q \"" + archive_path.string() + "\" -d \"" +
                          extract_dir.string() + "\"";
#endif

        int result = std::system(cmd.c_str());
        if (result != 0) {
            throw WbvmError(ErrorKind::EXTRACT_FAILED,
                            "Failed to extract " + archive_path.string() +
                            " (exit status " + std::to_string(result) + ")");
        }
    }

    AcquisitionPipeline::AcquisitionPipeline(const InstallationTracker& tracker,
                                             IFileFetcher& fetcher,
                                             IArchiveExtractor& extractor)
        : tracker_(tracker)
        , fetcher_(fetcher)
        , extractor_(extractor)
        , staging_dir_(tracker.get_root_dir() / ".staging") {}

    std::filesystem::path AcquisitionPipeline::acquire(const ReleaseRecord& release,
                                                       const AssetRecord& asset) {
        const std::string version = release.version();
        if (!InstallationTracker::is_valid_version(version)) {
            throw WbvmError(ErrorKind::FILESYSTEM_FAILED,
                            "Refusing to install release with unusable name: " + release.name);
        }

        std::error_code ec;

        std::filesystem::create_directories(staging_dir_, ec);
        if (ec) {
            fs_failure("create", staging_dir_, ec);
        }

        // Asset names come from the release index; keep only the last component
        std::filesystem::path archive_path = staging_dir_ / std::filesystem::path(asset.name).filename();
        fetcher_.fetch(asset.download_url, archive_path);

        std::filesystem::path extract_dir = staging_dir_ / version;
        std::filesystem::remove_all(extract_dir, ec);
        if (ec) {
            fs_failure("clear", extract_dir, ec);
        }

        extractor_.extract(archive_path, extract_dir);
        mark_executable(extract_dir);

        if (!std::filesystem::is_regular_file(extract_dir / tracker_.get_executable(), ec)) {
            throw WbvmError(ErrorKind::EXTRACT_FAILED,
                            "Unable to find " + tracker_.get_executable() + " in " + asset.name);
        }

        std::filesystem::path version_dir = tracker_.version_dir(version);
        std::filesystem::remove_all(version_dir, ec);
        if (ec) {
            fs_failure("remove", version_dir, ec);
        }
        std::filesystem::rename(extract_dir, version_dir, ec);
        if (ec) {
            fs_failure("move staged install into", version_dir, ec);
        }

        std::filesystem::remove(archive_path, ec);

        return version_dir;
    }

    void AcquisitionPipeline::mark_executable(const std::filesystem::path& dir) {
        std::error_code ec;
        std::filesystem::directory_iterator it(dir, ec);
        if (ec) {
            fs_failure("read", dir, ec);
        }

        const std::filesystem::directory_iterator end;
        for (; it != end; it.increment(ec)) {
            const auto& entry = *it;
            std::error_code entry_ec;
            if (entry.is_symlink(entry_ec) || !entry.is_regular_file(entry_ec)) {
                continue;
            }
            std::filesystem::permissions(entry.path(),
                                         std::filesystem::perms::owner_exec |
                                         std::filesystem::perms::group_exec |
                                         std::filesystem::perms::others_exec,
                                         std::filesystem::perm_options::add, entry_ec);
            if (entry_ec) {
                fs_failure("chmod", entry.path(), entry_ec);
            }
        }
        if (ec) {
            fs_failure("read", dir, ec);
        }
    }

} // namespace wbvm
