/**
 * @file release_catalog.hpp
 * @brief Persists and loads the cached release catalog
 * 
 * This header provides:
 * - IReleaseIndex: the contract for fetching the whole release list
 * - GitHubReleaseIndex: libcpr implementation against the GitHub API
 * - ReleaseCatalog: the releases.json store under the root directory
 * 
 * The catalog is the full provider response, replaced wholesale on every
 * successful refresh. It carries no timestamp; it is stale as soon as it
 * has been written.
 */

#pragma once

#include <string>
#include <filesystem>
#include <nlohmann/json.hpp>

#include "wbvm/release.hpp"

namespace wbvm {

    /**
     * @brief Source of the release list
     */
    class IReleaseIndex {
    public:
        virtual ~IReleaseIndex() = default;

        /**
         * @brief Fetch the whole release list
         * 
         * @return nlohmann::json A JSON array of release objects, newest first
         * @throws WbvmError FETCH_FAILED on transport/HTTP errors or when the
         *         response is not a JSON array
         */
        virtual nlohmann::json fetch_releases() = 0;
    };

    /**
     * @brief Release index backed by the GitHub releases API
     * 
     * Requests up to 100 releases per call with redirects enabled. GitHub
     * rejects requests without a User-Agent, so one is always sent.
     */
    class GitHubReleaseIndex : public IReleaseIndex {
    public:
        explicit GitHubReleaseIndex(std::string url);

        nlohmann::json fetch_releases() override;

    private:
        std::string url_;
    };

    /**
     * @brief Outcome of ReleaseCatalog::refresh()
     */
    enum class RefreshStatus {
        UPDATED,        ///< releases.json replaced with the fetched list
        FETCH_FAILED,   ///< Provider failed; previous catalog untouched
        WRITE_FAILED    ///< Fetched list discarded; previous catalog untouched
    };

    struct RefreshResult {
        RefreshStatus status = RefreshStatus::UPDATED;
        std::string message;    ///< Empty on UPDATED

        [[nodiscard]] bool ok() const { return status == RefreshStatus::UPDATED; }
    };

    /**
     * @brief The releases.json store
     * 
     * Usage:
     *   GitHubReleaseIndex index(settings.release_index_url);
     *   ReleaseCatalog catalog(root_dir, index);
     *   auto refreshed = catalog.refresh();   // never throws
     *   Catalog releases = catalog.load();    // throws CATALOG_UNAVAILABLE
     */
    class ReleaseCatalog {
    public:
        ReleaseCatalog(const std::filesystem::path& root_dir, IReleaseIndex& index);

        /**
         * @brief Fetch the release list and overwrite releases.json
         * 
         * Failures are reported through the result, never thrown: listing
         * and installing can still proceed against the previous snapshot.
         * The new snapshot is written to a temporary file and renamed into
         * place, so a failed write never truncates the old one.
         * 
         * @return RefreshResult What happened, with a message on failure
         */
        RefreshResult refresh();

        /**
         * @brief Read the persisted catalog
         * 
         * @return Catalog Releases in provider order
         * @throws WbvmError CATALOG_UNAVAILABLE if releases.json is missing,
         *         unreadable or not an array of release objects
         */
        [[nodiscard]] Catalog load() const;

        /**
         * @brief Whether any releases.json entry exists, usable or not
         */
        [[nodiscard]] bool has_snapshot() const;

        [[nodiscard]] std::filesystem::path get_catalog_path() const { return catalog_path_; }

    private:
        std::filesystem::path catalog_path_;    ///< <root>/releases.json
        IReleaseIndex& index_;
    };

} // namespace wbvm
