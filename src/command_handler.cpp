//
// Created by opencode on 17/10/2026.
//

#include "wbvm/command_handler.hpp"
#include "wbvm/release_catalog.hpp"
#include "wbvm/version_resolver.hpp"
#include "wbvm/installation_tracker.hpp"
#include "wbvm/activation_manager.hpp"
#include "wbvm/acquisition_pipeline.hpp"
#include "wbvm/audit_logger.hpp"
#include "wbvm/errors.hpp"

namespace wbvm {

    CommandHandler::CommandHandler(ReleaseCatalog& catalog,
                                   InstallationTracker& tracker,
                                   ActivationManager& activation,
                                   AcquisitionPipeline& pipeline,
                                   AuditLogger& audit_logger,
                                   std::string product,
                                   std::optional<std::string> platform_id,
                                   std::ostream& out,
                                   std::ostream& err)
        : catalog_(catalog)
        , tracker_(tracker)
        , activation_(activation)
        , pipeline_(pipeline)
        , audit_logger_(audit_logger)
        , product_(std::move(product))
        , platform_id_(std::move(platform_id))
        , out_(out)
        , err_(err) {}

    int CommandHandler::execute(const ParsedArgs& args) {
        std::string command_line = args.command_name;
        for (const auto& arg : args.positional_args) {
            command_line += " " + arg;
        }
        audit_logger_.log_command(command_line);

        const std::string token = args.version_token().value_or("");

        try {
            switch (args.command) {
                case Command::LIST:    return handle_list();
                case Command::INSTALL: return handle_install(token);
                case Command::USE:     return handle_use(token);
                case Command::DEFAULT: return handle_default(token);
                case Command::CURRENT: return handle_current();
                default:
                    err_ << "Unknown command: " << args.command_name << std::endl;
                    audit_logger_.log_error("Unknown command: " + args.command_name, "dispatch");
                    return 1;
            }
        } catch (const WbvmError& e) {
            err_ << "Error: " << e.what() << std::endl;
            audit_logger_.log_error(e.what(), error_kind_to_string(e.kind()));
            return 1;
        } catch (const std::exception& e) {
            err_ << "Error: " << e.what() << std::endl;
            audit_logger_.log_error(e.what(), args.command_name);
            return 1;
        }
    }

    int CommandHandler::handle_list() {
        RefreshResult refreshed = catalog_.refresh();
        switch (refreshed.status) {
            case RefreshStatus::UPDATED:
                audit_logger_.log_action("Release catalog refreshed", catalog_.get_catalog_path().string());
                break;
            case RefreshStatus::FETCH_FAILED:
                report_refresh_failure("Could not fetch available releases", refreshed.message);
                break;
            case RefreshStatus::WRITE_FAILED:
                report_refresh_failure("Could not write releases file", refreshed.message);
                break;
        }

        if (!refreshed.ok() && !catalog_.has_snapshot()) {
            err_ << "Warning: No releases known" << std::endl;
            audit_logger_.log_info("No release catalog available, listing nothing");
            return 0;
        }

        Catalog releases = catalog_.load();
        auto installed = tracker_.list_installed();

        for (const auto& release : releases) {
            std::string version = release.version();
            if (installed.count(version) > 0) {
                out_ << version << " (installed)" << std::endl;
            } else {
                out_ << version << std::endl;
            }
        }

        return 0;
    }

    int CommandHandler::handle_install(const std::string& token) {
        ReleaseRecord release = resolve(token, catalog_.load());

        if (!platform_id_) {
            throw WbvmError(ErrorKind::UNSUPPORTED_PLATFORM, "This operating system is not supported.");
        }

        AssetSelection selection = select_asset(release, *platform_id_, product_);
        if (selection.ambiguous()) {
            std::string warning = "Release " + release.name + " has " +
                                  std::to_string(selection.match_count) + " assets named " +
                                  selection.asset.name + ", using the first one";
            err_ << "Warning: " << warning << std::endl;
            audit_logger_.log_warning(warning);
        }

        audit_logger_.log_action("Downloading", selection.asset.download_url);
        auto version_dir = pipeline_.acquire(release, selection.asset);
        audit_logger_.log_success("Installed " + release.version(), version_dir.string());

        out_ << "Ok" << std::endl;
        return 0;
    }

    int CommandHandler::handle_use(const std::string& token) {
        out_ << "use " << token << std::endl;
        return 0;
    }

    int CommandHandler::handle_default(const std::string& token) {
        std::string version = token;
        if (token == LATEST_TOKEN) {
            version = resolve(token, catalog_.load()).version();
        }

        activation_.set_default(version);
        audit_logger_.log_success("Default version set", version);

        out_ << "Ok" << std::endl;
        return 0;
    }

    int CommandHandler::handle_current() {
        auto version = activation_.get_default();
        if (version) {
            out_ << *version << std::endl;
        } else {
            out_ << "No default version set" << std::endl;
        }
        return 0;
    }

    void CommandHandler::report_refresh_failure(const std::string& prefix, const std::string& message) {
        err_ << "Warning: " << prefix << ": " << message << std::endl;
        audit_logger_.log_warning(prefix + ": " + message);
    }

} // namespace wbvm
