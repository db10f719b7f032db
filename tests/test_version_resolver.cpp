#include <gtest/gtest.h>
#include "test_support.hpp"
#include "wbvm/version_resolver.hpp"

using namespace wbvm;
using wbvm::test::make_release;

namespace {

const std::string LINUX_ASSET = "worterbuch-x86_64-unknown-linux-gnu.zip";
const std::string WINDOWS_ASSET = "worterbuch-x86_64-pc-windows-msvc.zip";
const std::string MACOS_ASSET = "worterbuch-x86_64-apple-darwin.zip";

Catalog sample_catalog() {
    return {
        make_release("v2.0.0", {LINUX_ASSET, WINDOWS_ASSET, MACOS_ASSET}),
        make_release("v1.3.1", {LINUX_ASSET}),
        make_release("v1.3.0", {}),
    };
}

ErrorKind kind_of(const std::function<void()>& fn) {
    try {
        fn();
    } catch (const WbvmError& e) {
        return e.kind();
    }
    ADD_FAILURE() << "expected WbvmError";
    return ErrorKind::FILESYSTEM_FAILED;
}

} // namespace

TEST(VersionResolverTest, LatestIsFirstEntry) {
    auto catalog = sample_catalog();
    EXPECT_EQ(resolve("latest", catalog).name, "v2.0.0");
    EXPECT_EQ(resolve("latest", catalog).name, resolve(catalog[0].version(), catalog).name);
}

TEST(VersionResolverTest, BareVersionMatchesExactly) {
    auto catalog = sample_catalog();
    EXPECT_EQ(resolve("1.3.1", catalog).name, "v1.3.1");
    EXPECT_EQ(resolve("1.3.0", catalog).version(), "1.3.0");

    EXPECT_EQ(kind_of([&] { resolve("1.3", catalog); }), ErrorKind::VERSION_NOT_FOUND);
    EXPECT_EQ(kind_of([&] { resolve("v1.3.1", catalog); }), ErrorKind::VERSION_NOT_FOUND);
    EXPECT_EQ(kind_of([&] { resolve("9.9.9", catalog); }), ErrorKind::VERSION_NOT_FOUND);
}

TEST(VersionResolverTest, LatestOnEmptyCatalogIsNotFound) {
    EXPECT_EQ(kind_of([] { resolve("latest", Catalog{}); }), ErrorKind::VERSION_NOT_FOUND);
}

TEST(VersionResolverTest, NotFoundMessageNamesTheTag) {
    try {
        resolve("4.0.0", sample_catalog());
        FAIL() << "expected VERSION_NOT_FOUND";
    } catch (const WbvmError& e) {
        EXPECT_NE(std::string(e.what()).find("v4.0.0"), std::string::npos);
    }
}

TEST(VersionResolverTest, AssetNamesFollowPlatformTable) {
    EXPECT_EQ(asset_name_for("worterbuch", Platform::LINUX_X64), LINUX_ASSET);
    EXPECT_EQ(asset_name_for("worterbuch", Platform::WINDOWS_X64), WINDOWS_ASSET);
    EXPECT_EQ(asset_name_for("worterbuch", Platform::MACOS_X64), MACOS_ASSET);
    EXPECT_EQ(asset_name_for("other", Platform::LINUX_X64), "other-x86_64-unknown-linux-gnu.zip");
}

TEST(VersionResolverTest, PlatformIdentifiersRoundTrip) {
    for (auto platform : {Platform::LINUX_X64, Platform::WINDOWS_X64, Platform::MACOS_X64}) {
        auto parsed = parse_platform(platform_to_string(platform));
        ASSERT_TRUE(parsed.has_value());
        EXPECT_EQ(*parsed, platform);
    }
    EXPECT_FALSE(parse_platform("linux-arm64").has_value());
    EXPECT_FALSE(parse_platform("").has_value());
}

TEST(VersionResolverTest, SelectsAssetForEachPlatform) {
    auto release = sample_catalog()[0];
    EXPECT_EQ(select_asset(release, "linux-x64", "worterbuch").asset.name, LINUX_ASSET);
    EXPECT_EQ(select_asset(release, "windows-x64", "worterbuch").asset.name, WINDOWS_ASSET);
    EXPECT_EQ(select_asset(release, Platform::MACOS_X64, "worterbuch").asset.name, MACOS_ASSET);
    EXPECT_FALSE(select_asset(release, "linux-x64", "worterbuch").ambiguous());
}

TEST(VersionResolverTest, UnsupportedPlatformNeverFallsThrough) {
    auto release = sample_catalog()[0];
    for (const std::string id : {"freebsd-x64", "linux-arm64", "Linux", ""}) {
        EXPECT_EQ(kind_of([&] { select_asset(release, id, "worterbuch"); }),
                  ErrorKind::UNSUPPORTED_PLATFORM) << id;
    }
}

TEST(VersionResolverTest, MissingAssetIsAssetNotFound) {
    auto catalog = sample_catalog();
    EXPECT_EQ(kind_of([&] { select_asset(catalog[1], "macos-x64", "worterbuch"); }),
              ErrorKind::ASSET_NOT_FOUND);
    EXPECT_EQ(kind_of([&] { select_asset(catalog[2], "linux-x64", "worterbuch"); }),
              ErrorKind::ASSET_NOT_FOUND);
}

TEST(VersionResolverTest, DuplicateAssetsAreFlaggedFirstWins) {
    ReleaseRecord release = make_release("v3.0.0");
    release.assets.push_back({LINUX_ASSET, "first"});
    release.assets.push_back({"unrelated.txt", "other"});
    release.assets.push_back({LINUX_ASSET, "second"});

    auto selection = select_asset(release, Platform::LINUX_X64, "worterbuch");
    EXPECT_TRUE(selection.ambiguous());
    EXPECT_EQ(selection.match_count, 2u);
    EXPECT_EQ(selection.asset.download_url, "first");
}

TEST(VersionResolverTest, DetectPlatformMatchesBuildHost) {
    auto platform = detect_platform();
#if defined(__linux__) && defined(__x86_64__)
    ASSERT_TRUE(platform.has_value());
    EXPECT_EQ(*platform, Platform::LINUX_X64);
#elif defined(__APPLE__) && defined(__x86_64__)
    ASSERT_TRUE(platform.has_value());
    EXPECT_EQ(*platform, Platform::MACOS_X64);
#else
    (void)platform;
#endif
}

TEST(ReleaseRecordTest, ParsesGitHubReleaseObjects) {
    auto j = nlohmann::json::parse(R"([
        {"name": "v1.0.0", "tag_name": "v1.0.0", "draft": false,
         "assets": [{"name": "a.zip", "browser_download_url": "https://x/a.zip", "size": 3}]},
        {"name": null, "tag_name": "v0.9.0"},
        {"name": "", "tag_name": "v0.8.0", "assets": []}
    ])");

    auto catalog = j.get<Catalog>();
    ASSERT_EQ(catalog.size(), 3u);
    EXPECT_EQ(catalog[0].version(), "1.0.0");
    ASSERT_EQ(catalog[0].assets.size(), 1u);
    EXPECT_EQ(catalog[0].assets[0].download_url, "https://x/a.zip");
    EXPECT_EQ(catalog[1].name, "v0.9.0");
    EXPECT_TRUE(catalog[1].assets.empty());
    EXPECT_EQ(catalog[2].name, "v0.8.0");
}

TEST(ReleaseRecordTest, VersionStripsOnlyTheTagPrefix) {
    EXPECT_EQ(make_release("v1.2.3").version(), "1.2.3");
    EXPECT_EQ(make_release("1.2.3").version(), "1.2.3");
    EXPECT_EQ(tag_for_version("1.2.3"), "v1.2.3");
}
