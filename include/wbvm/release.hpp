/**
 * @file release.hpp
 * @brief Release and asset records as published by the release index
 *
 * A release is identified by a prefixed tag name ("v1.2.3") and bundles
 * one archive asset per supported platform. The JSON mapping follows the
 * GitHub releases API:
 *
 *   {
 *     "name": "v1.2.3",
 *     "tag_name": "v1.2.3",
 *     "assets": [
 *       {"name": "worterbuch-x86_64-unknown-linux-gnu.zip",
 *        "browser_download_url": "https://..."}
 *     ]
 *   }
 */

#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace wbvm {

    /// Prefix character every release name starts with
    inline constexpr char VERSION_PREFIX = 'v';

    /**
     * @brief One downloadable file attached to a release
     */
    struct AssetRecord {
        std::string name;           ///< Archive filename
        std::string download_url;   ///< browser_download_url
    };

    /**
     * @brief One published version
     */
    struct ReleaseRecord {
        std::string name;                   ///< Tag, e.g. "v1.2.3"
        std::vector<AssetRecord> assets;    ///< Provider order

        /**
         * @brief Bare version string: name without the leading 'v'
         *
         * Names lacking the prefix are returned unchanged.
         */
        [[nodiscard]] std::string version() const;
    };

    /// Ordered snapshot of the release index, newest first
    using Catalog = std::vector<ReleaseRecord>;

    /**
     * @brief Builds the tag name for a bare version ("1.2.3" → "v1.2.3")
     */
    std::string tag_for_version(const std::string& version);

    void to_json(nlohmann::json& j, const AssetRecord& asset);
    void from_json(const nlohmann::json& j, AssetRecord& asset);
    void to_json(nlohmann::json& j, const ReleaseRecord& release);

    /**
     * @brief Reads a release object
     *
     * Uses "tag_name" when "name" is missing, null or empty. A missing
     * "assets" array yields a release without assets.
     *
     * @throws nlohmann::json::exception if neither name field is a string
     */
    void from_json(const nlohmann::json& j, ReleaseRecord& release);

} // namespace wbvm
