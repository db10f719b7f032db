/**
 * @file acquisition_pipeline.hpp
 * @brief Downloads, unpacks and installs a release archive
 * 
 * This header provides:
 * - IFileFetcher / CprFileFetcher: download one URL to one path
 * - IArchiveExtractor / SystemArchiveExtractor: unpack one archive into one directory
 * - AcquisitionPipeline: fetch → extract → chmod → rename into place
 * 
 * Layout during an install of 2.0.0:
 *   <root>/.staging/worterbuch-x86_64-unknown-linux-gnu.zip   downloaded archive
 *   <root>/.staging/2.0.0/                                    extraction target
 *   <root>/2.0.0/                                             final location (rename)
 * 
 * The final directory only appears once extraction has succeeded, so a
 * failed install never leaves a half-written version behind. The staging
 * area is not cleaned on failure; the next attempt clears it.
 */

#pragma once

#include <string>
#include <filesystem>

#include "wbvm/release.hpp"

namespace wbvm {

    class InstallationTracker;

    /**
     * @brief Downloads a single file
     */
    class IFileFetcher {
    public:
        virtual ~IFileFetcher() = default;

        /**
         * @throws WbvmError FETCH_FAILED if the download fails
         */
        virtual void fetch(const std::string& url, const std::filesystem::path& destination) = 0;
    };

    /**
     * @brief Unpacks a single archive
     */
    class IArchiveExtractor {
    public:
        virtual ~IArchiveExtractor() = default;

        /**
         * @throws WbvmError EXTRACT_FAILED if extraction fails
         */
        virtual void extract(const std::filesystem::path& archive_path,
                             const std::filesystem::path& extract_dir) = 0;
    };

    /**
     * @brief HTTP download using libcpr (libcurl wrapper), following redirects
     */
    class CprFileFetcher : public IFileFetcher {
    public:
        void fetch(const std::string& url, const std::filesystem::path& destination) override;
    };

    /**
     * @brief Zip extraction through the system `unzip` command
     * 
     * Windows hosts use the bundled bsdtar (`tar -xf`) instead. Paths
     * containing `"`, `` ` ``, `$` or `\` are rejected with EXTRACT_FAILED
     * before the shell is involved.
     */
    class SystemArchiveExtractor : public IArchiveExtractor {
    public:
        void extract(const std::filesystem::path& archive_path,
                     const std::filesystem::path& extract_dir) override;
    };

    class AcquisitionPipeline {
    public:
        AcquisitionPipeline(const InstallationTracker& tracker,
                            IFileFetcher& fetcher,
                            IArchiveExtractor& extractor);

        /**
         * @brief Installs one release archive
         * 
         * 1. Downloads @p asset into the staging area
         * 2. Extracts it into .staging/<version>/ (cleared first)
         * 3. Adds execute permission to every regular file directly inside
         * 4. Checks that the product executable is present
         * 5. Replaces <root>/<version> with the staged directory
         * 6. Deletes the downloaded archive
         * 
         * @param release Resolved release; its bare version names the directory
         * @param asset Archive selected for the host platform
         * @return std::filesystem::path The installed version directory
         * @throws WbvmError FETCH_FAILED, EXTRACT_FAILED or FILESYSTEM_FAILED
         */
        std::filesystem::path acquire(const ReleaseRecord& release, const AssetRecord& asset);

    private:
        const InstallationTracker& tracker_;
        IFileFetcher& fetcher_;
        IArchiveExtractor& extractor_;
        std::filesystem::path staging_dir_;     ///< <root>/.staging

        static void mark_executable(const std::filesystem::path& dir);
    };

} // namespace wbvm
