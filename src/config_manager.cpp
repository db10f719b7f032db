//
// Created by opencode on 17/10/2026.
//

#include "wbvm/config_manager.hpp"
#include "wbvm/errors.hpp"
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <fstream>

namespace wbvm {

    namespace {

        std::optional<std::string> string_field(const nlohmann::json& config, const char* key) {
            auto it = config.find(key);
            if (it == config.end() || it->is_null()) {
                return std::nullopt;
            }
            if (!it->is_string()) {
                throw WbvmError(ErrorKind::CONFIG_INVALID,
                                std::string("config.json: \"") + key + "\" must be a string");
            }
            return it->get<std::string>();
        }

        std::optional<std::string> env_value(const char* name) {
            const char* value = std::getenv(name);
            if (value && *value) {
                return std::string(value);
            }
            return std::nullopt;
        }

    } // namespace

    ConfigManager::ConfigManager(std::filesystem::path root_dir)
        : root_dir_(std::move(root_dir))
        , config_path_(root_dir_ / "config.json") {}

    Settings ConfigManager::load() const {
        Settings settings;
        settings.root_dir = root_dir_;
        apply_file(settings);
        apply_environment(settings);
        return settings;
    }

    void ConfigManager::apply_file(Settings& settings) const {
        std::error_code ec;
        bool present = std::filesystem::is_regular_file(config_path_, ec);
        if (ec && ec != std::errc::no_such_file_or_directory) {
            throw WbvmError(ErrorKind::CONFIG_INVALID,
                            "Could not read config file " + config_path_.string() + ": " + ec.message());
        }
        if (!present) {
            return;
        }

        std::ifstream file(config_path_);
        if (!file) {
            throw WbvmError(ErrorKind::CONFIG_INVALID,
                            "Could not read config file: " + config_path_.string());
        }

        nlohmann::json config;
        try {
            config = nlohmann::json::parse(file);
        } catch (const nlohmann::json::parse_error& e) {
            throw WbvmError(ErrorKind::CONFIG_INVALID,
                            "Could not parse " + config_path_.string() + ": " + e.what());
        }

        if (!config.is_object()) {
            throw WbvmError(ErrorKind::CONFIG_INVALID,
                            config_path_.string() + " must contain a JSON object");
        }

        if (auto product = string_field(config, "product")) {
            if (product->empty()) {
                throw WbvmError(ErrorKind::CONFIG_INVALID, "config.json: \"product\" must not be empty");
            }
            settings.product = *product;
        }
        if (auto url = string_field(config, "release_index_url")) {
            settings.release_index_url = *url;
        }
        if (auto platform = string_field(config, "platform")) {
            settings.platform_override = *platform;
        }
    }

    void ConfigManager::apply_environment(Settings& settings) {
        if (auto url = env_value("WBVM_RELEASES_URL")) {
            settings.release_index_url = *url;
        }
        if (auto platform = env_value("WBVM_PLATFORM")) {
            settings.platform_override = *platform;
        }
    }

} // namespace wbvm
