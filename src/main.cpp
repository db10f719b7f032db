/**
 * @file main.cpp
 * @brief Entry point for wbvm, the Wörterbuch version manager
 *
 * Components:
 * - ConfigManager: Settings from config.json and environment
 * - AuditLogger: Tracks every command and action in <root>/wbvm.log
 * - ReleaseCatalog: Cached release list (releases.json)
 * - InstallationTracker: Installed versions, read from the directory tree
 * - ActivationManager: The `bin` alias to the default version
 * - AcquisitionPipeline: Download, extract, install
 * - CommandHandler: Runs the requested command
 *
 * The root directory is created on first run; failing to create it is
 * fatal.
 */

#include <iostream>
#include <filesystem>

#include "wbvm/utils.hpp"
#include "wbvm/errors.hpp"
#include "wbvm/arg_parser.hpp"
#include "wbvm/config_manager.hpp"
#include "wbvm/audit_logger.hpp"
#include "wbvm/release_catalog.hpp"
#include "wbvm/version_resolver.hpp"
#include "wbvm/installation_tracker.hpp"
#include "wbvm/activation_manager.hpp"
#include "wbvm/acquisition_pipeline.hpp"
#include "wbvm/command_handler.hpp"

using namespace wbvm;

/**
 * @brief Creates the root directory if it does not exist yet
 *
 * @return true if the root directory exists afterwards
 */
static bool bootstrap_root(const std::filesystem::path& root_dir) {
    std::error_code ec;
    if (std::filesystem::is_directory(root_dir, ec)) {
        return true;
    }

    std::filesystem::create_directories(root_dir, ec);
    if (ec) {
        std::cerr << "Error creating app dir " << root_dir << ": " << ec.message() << std::endl;
        return false;
    }
    return std::filesystem::is_directory(root_dir, ec);
}

int main(int argc, char* argv[]) {
    ParsedArgs args = ArgParser::parse(argc, argv);

    if (args.show_help) {
        std::cout << ArgParser::get_help_message() << std::endl;
        return 0;
    }

    if (args.show_version) {
        std::cout << ArgParser::get_version_string() << std::endl;
        return 0;
    }

    if (auto usage_error = ArgParser::validate(args)) {
        std::cerr << *usage_error << std::endl << std::endl;
        std::cerr << ArgParser::get_help_message() << std::endl;
        return 1;
    }

    try {
        const std::filesystem::path root_dir = get_wbvm_dir();
        if (!bootstrap_root(root_dir)) {
            return 1;
        }

        Settings settings;
        try {
            settings = ConfigManager(root_dir).load();
        } catch (const WbvmError& e) {
            std::cerr << "Error: " << e.what() << std::endl;
            return 1;
        }

        AuditLogger audit_logger(settings.root_dir);

        std::optional<std::string> platform_id = settings.platform_override;
        if (!platform_id) {
            if (auto host = detect_platform()) {
                platform_id = platform_to_string(*host);
            }
        }

        GitHubReleaseIndex release_index(settings.release_index_url);
        ReleaseCatalog catalog(settings.root_dir, release_index);
        InstallationTracker tracker(settings.root_dir, executable_name(settings.product));
        ActivationManager activation(tracker);
        CprFileFetcher fetcher;
        SystemArchiveExtractor extractor;
        AcquisitionPipeline pipeline(tracker, fetcher, extractor);

        CommandHandler command_handler(catalog, tracker, activation, pipeline, audit_logger,
                                       settings.product, platform_id, std::cout, std::cerr);

        return command_handler.execute(args);
    } catch (const std::exception& e) {
        std::cerr << "FATAL ERROR: " << e.what() << std::endl;
        return 1;
    }
}
