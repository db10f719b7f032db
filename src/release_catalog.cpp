//
// Created by opencode on 17/10/2026.
//

#include "wbvm/release_catalog.hpp"
#include "wbvm/errors.hpp"
#include <cpr/cpr.h>
#include <fstream>

namespace wbvm {

    GitHubReleaseIndex::GitHubReleaseIndex(std::string url)
        : url_(std::move(url)) {}

    nlohmann::json GitHubReleaseIndex::fetch_releases() {
        cpr::Response response = cpr::Get(cpr::Url{url_},
                                          cpr::Parameters{{"per_page", "100"}},
                                          cpr::Header{{"User-Agent", "wbvm"},
                                                      {"Accept", "application/vnd.github+json"}},
                                          cpr::Redirect(true));

        if (response.error) {
            throw WbvmError(ErrorKind::FETCH_FAILED,
                            "Request to " + url_ + " failed: " + response.error.message);
        }
        if (response.status_code != 200) {
            throw WbvmError(ErrorKind::FETCH_FAILED,
                            "Request to " + url_ + " failed with status: " +
                            std::to_string(response.status_code));
        }

        nlohmann::json releases = nlohmann::json::parse(response.text, nullptr, false);
        if (releases.is_discarded() || !releases.is_array()) {
            throw WbvmError(ErrorKind::FETCH_FAILED,
                            "Release index at " + url_ + " did not return a JSON array");
        }
        return releases;
    }

    ReleaseCatalog::ReleaseCatalog(const std::filesystem::path& root_dir, IReleaseIndex& index)
        : catalog_path_(root_dir / "releases.json")
        , index_(index) {}

    RefreshResult ReleaseCatalog::refresh() {
        nlohmann::json releases;
        try {
            releases = index_.fetch_releases();
        } catch (const WbvmError& e) {
            return {RefreshStatus::FETCH_FAILED, e.what()};
        }

        std::filesystem::path temp_path = catalog_path_;
        temp_path += ".tmp";

        {
            std::ofstream file(temp_path, std::ios::trunc);
            if (!file) {
                return {RefreshStatus::WRITE_FAILED,
                        "Failed to open " + temp_path.string() + " for writing"};
            }
            file << releases.dump(2);
            file.close();
            if (!file) {
                std::error_code ignored;
                std::filesystem::remove(temp_path, ignored);
                return {RefreshStatus::WRITE_FAILED, "Failed to write " + temp_path.string()};
            }
        }

        std::error_code ec;
        std::filesystem::rename(temp_path, catalog_path_, ec);
        if (ec) {
            std::error_code ignored;
            std::filesystem::remove(temp_path, ignored);
            return {RefreshStatus::WRITE_FAILED,
                    "Failed to replace " + catalog_path_.string() + ": " + ec.message()};
        }

        return {RefreshStatus::UPDATED, ""};
    }

    bool ReleaseCatalog::has_snapshot() const {
        std::error_code ec;
        return std::filesystem::exists(std::filesystem::symlink_status(catalog_path_, ec));
    }

    Catalog ReleaseCatalog::load() const {
        std::error_code ec;
        bool present = std::filesystem::is_regular_file(catalog_path_, ec);
        if (ec && ec != std::errc::no_such_file_or_directory) {
            throw WbvmError(ErrorKind::CATALOG_UNAVAILABLE,
                            "Could not read " + catalog_path_.string() + ": " + ec.message());
        }
        if (!present) {
            throw WbvmError(ErrorKind::CATALOG_UNAVAILABLE,
                            "No release catalog found at " + catalog_path_.string() +
                            ", run 'wbvm list' to fetch available releases");
        }

        std::ifstream file(catalog_path_);
        if (!file) {
            throw WbvmError(ErrorKind::CATALOG_UNAVAILABLE,
                            "Could not read " + catalog_path_.string());
        }

        try {
            nlohmann::json releases = nlohmann::json::parse(file);
            if (!releases.is_array()) {
                throw WbvmError(ErrorKind::CATALOG_UNAVAILABLE,
                                catalog_path_.string() + " does not contain a release list");
            }
            return releases.get<Catalog>();
        } catch (const nlohmann::json::exception& e) {
            throw WbvmError(ErrorKind::CATALOG_UNAVAILABLE,
                            "Could not parse " + catalog_path_.string() + ": " + e.what());
        }
    }

} // namespace wbvm
