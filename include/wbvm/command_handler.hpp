/**
 * @file command_handler.hpp
 * @brief Executes wbvm commands
 * 
 * The handler coordinates between:
 * - ReleaseCatalog: to refresh and load the release list
 * - the version resolver: to turn tokens into releases and assets
 * - InstallationTracker: to annotate listings
 * - AcquisitionPipeline: to install a release
 * - ActivationManager: to switch the default version
 * 
 * Every command runs to completion or aborts on the first error (WbvmError
 * or any other std::exception), which is printed once to the error stream
 * and recorded in the audit log.
 */

#pragma once

#include <string>
#include <optional>
#include <ostream>

#include "wbvm/arg_parser.hpp"

namespace wbvm {
    class ReleaseCatalog;
    class InstallationTracker;
    class ActivationManager;
    class AcquisitionPipeline;
    class AuditLogger;
}

namespace wbvm {

    class CommandHandler {
    public:
        /**
         * @brief Constructs command handler with dependencies
         * 
         * @param catalog Release catalog store
         * @param tracker Installation tracker
         * @param activation Manager for the `bin` alias
         * @param pipeline Acquisition pipeline for installs
         * @param audit_logger Audit log
         * @param product Product name used to pick assets
         * @param platform_id Platform identifier, or nullopt if the host is unsupported
         * @param out Stream for command results
         * @param err Stream for warnings and errors
         */
        CommandHandler(ReleaseCatalog& catalog,
                       InstallationTracker& tracker,
                       ActivationManager& activation,
                       AcquisitionPipeline& pipeline,
                       AuditLogger& audit_logger,
                       std::string product,
                       std::optional<std::string> platform_id,
                       std::ostream& out,
                       std::ostream& err);

        /**
         * @brief Executes a parsed command
         * 
         * @param args Arguments that passed ArgParser::validate()
         * @return int Process exit code (0 on success, 1 on error)
         */
        int execute(const ParsedArgs& args);

    private:
        ReleaseCatalog& catalog_;
        InstallationTracker& tracker_;
        ActivationManager& activation_;
        AcquisitionPipeline& pipeline_;
        AuditLogger& audit_logger_;
        std::string product_;
        std::optional<std::string> platform_id_;
        std::ostream& out_;
        std::ostream& err_;

        /**
         * @brief Handles `list`
         * 
         * Refreshes the catalog (a failed refresh is a warning), then prints
         * one bare version per release, suffixed " (installed)" when
         * installed. An empty catalog prints nothing. When the refresh
         * failed and no releases.json exists at all, warns "No releases
         * known" and succeeds without output.
         */
        int handle_list();

        /**
         * @brief Handles `install <version>|latest`
         * 
         * Resolves against the stored catalog, picks the asset for the
         * platform and acquires it. Prints "Ok" on success.
         */
        int handle_install(const std::string& token);

        /**
         * @brief Handles `use <version>`
         * 
         * Session-scoped selection is not implemented; only the intent is printed.
         */
        int handle_use(const std::string& token);

        /**
         * @brief Handles `default <version>|latest`
         * 
         * "latest" is resolved through the catalog; an explicit version is
         * taken as-is so that installed versions stay selectable after they
         * drop out of the release index.
         */
        int handle_default(const std::string& token);

        /**
         * @brief Handles `current`
         */
        int handle_current();

        void report_refresh_failure(const std::string& prefix, const std::string& message);
    };

} // namespace wbvm
