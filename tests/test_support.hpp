#pragma once

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <unistd.h>

#include <filesystem>
#include <fstream>
#include <functional>
#include <iterator>
#include <string>
#include <vector>

#include "wbvm/acquisition_pipeline.hpp"
#include "wbvm/errors.hpp"
#include "wbvm/release.hpp"
#include "wbvm/release_catalog.hpp"

namespace fs = std::filesystem;

namespace wbvm::test {

// Fresh root directory under /tmp for each test
class TempRootTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        root = fs::temp_directory_path() /
               ("wbvm_test_" + std::string(info->test_suite_name()) + "_" + info->name() + "_" +
                std::to_string(getpid()));
        fs::remove_all(root);
        fs::create_directories(root);
    }

    void TearDown() override {
        if (!root.empty()) {
            std::error_code ec;
            fs::remove_all(root, ec);
        }
    }

    fs::path root;
};

inline void write_file(const fs::path& path, const std::string& content = "binary content") {
    fs::create_directories(path.parent_path());
    std::ofstream f(path, std::ios::trunc);
    f << content;
}

inline std::string read_file(const fs::path& path) {
    std::ifstream f(path);
    return std::string(std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>());
}

inline void make_installed(const fs::path& root, const std::string& version,
                           const std::string& executable = "worterbuch") {
    write_file(root / version / executable);
}

inline ReleaseRecord make_release(const std::string& name,
                                  std::vector<std::string> asset_names = {}) {
    ReleaseRecord release;
    release.name = name;
    for (const auto& asset_name : asset_names) {
        release.assets.push_back({asset_name, "https://example.invalid/" + name + "/" + asset_name});
    }
    return release;
}

inline void write_catalog(const fs::path& root, const Catalog& releases) {
    nlohmann::json j = releases;
    write_file(root / "releases.json", j.dump(2));
}

// Returns a canned release list or fails like the network would
class FakeReleaseIndex : public IReleaseIndex {
public:
    nlohmann::json fetch_releases() override {
        ++calls;
        if (fail) {
            throw WbvmError(ErrorKind::FETCH_FAILED, "network unreachable");
        }
        return releases;
    }

    nlohmann::json releases = nlohmann::json::array();
    bool fail = false;
    int calls = 0;
};

// Records requested URLs and writes a placeholder archive
class FakeFileFetcher : public IFileFetcher {
public:
    void fetch(const std::string& url, const fs::path& destination) override {
        urls.push_back(url);
        if (fail) {
            throw WbvmError(ErrorKind::FETCH_FAILED, "Download of " + url + " failed with status: 404");
        }
        write_file(destination, "zip bytes");
    }

    std::vector<std::string> urls;
    bool fail = false;
};

// "Extracts" by creating the listed files in the target directory
class FakeArchiveExtractor : public IArchiveExtractor {
public:
    void extract(const fs::path& archive_path, const fs::path& extract_dir) override {
        archives.push_back(archive_path);
        if (fail) {
            throw WbvmError(ErrorKind::EXTRACT_FAILED, "Failed to extract " + archive_path.string());
        }
        fs::create_directories(extract_dir);
        for (const auto& file : files) {
            write_file(extract_dir / file);
        }
        if (after_extract) {
            after_extract(extract_dir);
        }
    }

    std::vector<std::string> files = {"worterbuch", "README.md"};
    std::vector<fs::path> archives;
    bool fail = false;
    std::function<void(const fs::path&)> after_extract;
};

} // namespace wbvm::test
