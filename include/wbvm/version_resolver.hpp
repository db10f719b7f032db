/**
 * @file version_resolver.hpp
 * @brief Maps user tokens to releases and platforms to assets
 * 
 * Tokens:
 *   "latest"  → first catalog entry (the provider lists newest first)
 *   "1.2.3"   → the entry named "v1.2.3", exact match only
 * 
 * Platforms and their archive naming convention:
 *   linux-x64   → <product>-x86_64-unknown-linux-gnu.zip
 *   windows-x64 → <product>-x86_64-pc-windows-msvc.zip
 *   macos-x64   → <product>-x86_64-apple-darwin.zip
 */

#pragma once

#include <string>
#include <optional>
#include <cstddef>

#include "wbvm/release.hpp"

namespace wbvm {

    inline constexpr const char* LATEST_TOKEN = "latest";

    enum class Platform {
        LINUX_X64,
        WINDOWS_X64,
        MACOS_X64
    };

    /**
     * @brief Converts a Platform to its identifier ("linux-x64", ...)
     */
    std::string platform_to_string(Platform platform);

    /**
     * @brief Parses a platform identifier
     * 
     * @return std::optional<Platform> nullopt for anything outside the set
     */
    std::optional<Platform> parse_platform(const std::string& platform_id);

    /**
     * @brief Detects the running host platform
     * 
     * Uses uname() on POSIX hosts. Only x86_64 Linux, macOS and Windows
     * have published archives.
     * 
     * @return std::optional<Platform> nullopt if the host is unsupported
     */
    std::optional<Platform> detect_platform();

    /**
     * @brief Archive filename expected for a platform
     * 
     * @param product Product name, e.g. "worterbuch"
     * @param platform Target platform
     * @return std::string e.g. "worterbuch-x86_64-unknown-linux-gnu.zip"
     */
    std::string asset_name_for(const std::string& product, Platform platform);

    /**
     * @brief Result of asset selection
     * 
     * match_count > 1 means the release is ambiguous; the first match is
     * used and callers are expected to warn.
     */
    struct AssetSelection {
        AssetRecord asset;
        std::size_t match_count = 0;

        [[nodiscard]] bool ambiguous() const { return match_count > 1; }
    };

    /**
     * @brief Resolves a token against a catalog
     * 
     * @param token "latest" or a bare version string (no 'v' prefix)
     * @param catalog Releases, newest first
     * @return ReleaseRecord The matching release
     * @throws WbvmError VERSION_NOT_FOUND if nothing matches
     */
    ReleaseRecord resolve(const std::string& token, const Catalog& catalog);

    /**
     * @brief Picks the archive for a platform
     * 
     * @throws WbvmError ASSET_NOT_FOUND if no asset has the expected name
     */
    AssetSelection select_asset(const ReleaseRecord& release, Platform platform,
                                const std::string& product);

    /**
     * @brief Picks the archive for a platform identifier
     * 
     * @throws WbvmError UNSUPPORTED_PLATFORM if @p platform_id is not one of
     *         linux-x64, windows-x64, macos-x64
     * @throws WbvmError ASSET_NOT_FOUND if no asset has the expected name
     */
    AssetSelection select_asset(const ReleaseRecord& release, const std::string& platform_id,
                                const std::string& product);

} // namespace wbvm
