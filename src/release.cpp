//
// Created by opencode on 17/10/2026.
//

#include "wbvm/release.hpp"

namespace wbvm {

    std::string ReleaseRecord::version() const {
        if (!name.empty() && name[0] == VERSION_PREFIX) {
            return name.substr(1);
        }
        return name;
    }

    std::string tag_for_version(const std::string& version) {
        return std::string(1, VERSION_PREFIX) + version;
    }

    void to_json(nlohmann::json& j, const AssetRecord& asset) {
        j = nlohmann::json{
            {"name", asset.name},
            {"browser_download_url", asset.download_url}
        };
    }

    void from_json(const nlohmann::json& j, AssetRecord& asset) {
        j.at("name").get_to(asset.name);
        j.at("browser_download_url").get_to(asset.download_url);
    }

    void to_json(nlohmann::json& j, const ReleaseRecord& release) {
        j = nlohmann::json{
            {"name", release.name},
            {"tag_name", release.name},
            {"assets", release.assets}
        };
    }

    void from_json(const nlohmann::json& j, ReleaseRecord& release) {
        // GitHub leaves "name" null for releases published without a title
        auto name_it = j.find("name");
        if (name_it != j.end() && name_it->is_string() && !name_it->get<std::string>().empty()) {
            release.name = name_it->get<std::string>();
        } else {
            j.at("tag_name").get_to(release.name);
        }

        release.assets.clear();
        auto assets_it = j.find("assets");
        if (assets_it != j.end() && assets_it->is_array()) {
            assets_it->get_to(release.assets);
        }
    }

} // namespace wbvm
