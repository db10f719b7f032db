//
// Created by opencode on 17/10/2026.
//

#include "wbvm/version_resolver.hpp"
#include "wbvm/errors.hpp"
#include <array>
#include <utility>

#if !defined(_WIN32)
#include <sys/utsname.h>
#endif

namespace wbvm {

    namespace {

        struct PlatformEntry {
            Platform platform;
            const char* id;
            const char* asset_suffix;   ///< "<arch>-<platform-triple>.zip"
        };

        constexpr std::array<PlatformEntry, 3> PLATFORMS = {{
            {Platform::LINUX_X64,   "linux-x64",   "x86_64-unknown-linux-gnu.zip"},
            {Platform::WINDOWS_X64, "windows-x64", "x86_64-pc-windows-msvc.zip"},
            {Platform::MACOS_X64,   "macos-x64",   "x86_64-apple-darwin.zip"},
        }};

        const PlatformEntry& entry_for(Platform platform) {
            for (const auto& entry : PLATFORMS) {
                if (entry.platform == platform) {
                    return entry;
                }
            }
            throw WbvmError(ErrorKind::UNSUPPORTED_PLATFORM, "Unsupported platform");
        }

    } // namespace

    std::string platform_to_string(Platform platform) {
        return entry_for(platform).id;
    }

    std::optional<Platform> parse_platform(const std::string& platform_id) {
        for (const auto& entry : PLATFORMS) {
            if (platform_id == entry.id) {
                return entry.platform;
            }
        }
        return std::nullopt;
    }

    std::optional<Platform> detect_platform() {
#if defined(_WIN32)
#if defined(_M_X64) || defined(__x86_64__)
        return Platform::WINDOWS_X64;
#else
        return std::nullopt;
#endif
#else
        struct utsname uname_data;
        if (uname(&uname_data) != 0) {
            return std::nullopt;
        }

        std::string sysname = uname_data.sysname;
        std::string machine = uname_data.machine;

        if (machine != "x86_64" && machine != "AMD64" && machine != "amd64") {
            return std::nullopt;
        }

        if (sysname == "Linux") {
            return Platform::LINUX_X64;
        }
        if (sysname == "Darwin") {
            return Platform::MACOS_X64;
        }
        return std::nullopt;
#endif
    }

    std::string asset_name_for(const std::string& product, Platform platform) {
        return product + "-" + entry_for(platform).asset_suffix;
    }

    ReleaseRecord resolve(const std::string& token, const Catalog& catalog) {
        if (token == LATEST_TOKEN) {
            if (catalog.empty()) {
                throw WbvmError(ErrorKind::VERSION_NOT_FOUND, "No releases known, cannot resolve latest");
            }
            return catalog.front();
        }

        const std::string tag = tag_for_version(token);
        for (const auto& release : catalog) {
            if (release.name == tag) {
                return release;
            }
        }

        throw WbvmError(ErrorKind::VERSION_NOT_FOUND, "No release with name " + tag + " found");
    }

    AssetSelection select_asset(const ReleaseRecord& release, Platform platform,
                                const std::string& product) {
        const std::string expected = asset_name_for(product, platform);

        AssetSelection selection;
        for (const auto& asset : release.assets) {
            if (asset.name == expected) {
                if (selection.match_count == 0) {
                    selection.asset = asset;
                }
                ++selection.match_count;
            }
        }

        if (selection.match_count == 0) {
            throw WbvmError(ErrorKind::ASSET_NOT_FOUND,
                            "No asset " + expected + " found in release " + release.name +
                            " for " + platform_to_string(platform));
        }
        return selection;
    }

    AssetSelection select_asset(const ReleaseRecord& release, const std::string& platform_id,
                                const std::string& product) {
        auto platform = parse_platform(platform_id);
        if (!platform) {
            throw WbvmError(ErrorKind::UNSUPPORTED_PLATFORM,
                            "Operating system " + platform_id + " is not supported");
        }
        return select_asset(release, *platform, product);
    }

} // namespace wbvm
