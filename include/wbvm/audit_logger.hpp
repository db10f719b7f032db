/**
 * @file audit_logger.hpp
 * @brief Audit logging system for wbvm
 * 
 * Tracks every command, filesystem action and error performed by wbvm.
 * Logs are appended to <root>/wbvm.log so that a failed install or a
 * stale default alias can be traced back after the process has exited.
 */

#pragma once

#include <string>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <chrono>
#include <ctime>
#include <sstream>
#include <iomanip>

namespace wbvm {

    /**
     * @brief Categories of audit log entries
     */
    enum class AuditCategory {
        CMD,        // Command received
        ACTION,     // Filesystem or network action performed
        WARNING,    // Recoverable problem (e.g. stale catalog kept)
        ERROR,      // Command aborted
        SUCCESS,    // Successful operation
        INFO        // General information
    };

    /**
     * @brief Thread-safe audit logger
     * 
     * Usage:
     *   AuditLogger audit(root_dir);
     *   audit.log_command("install 2.0.0");
     *   audit.log_action("Downloading", url);
     *   audit.log_success("Installed", "2.0.0");
     */
    class AuditLogger {
    public:
        /**
         * @brief Constructs audit logger
         * 
         * Creates @p logs_dir if needed and opens wbvm.log in append mode.
         * A log file that cannot be opened is reported once on stderr;
         * logging then becomes a no-op rather than aborting the command.
         *
         * @param logs_dir Directory holding wbvm.log (the root directory)
         */
        explicit AuditLogger(const std::filesystem::path& logs_dir);
        
        /**
         * @brief Destructor - closes log file
         */
        ~AuditLogger();

        AuditLogger(const AuditLogger&) = delete;
        AuditLogger& operator=(const AuditLogger&) = delete;

        /**
         * @brief Log a command received
         * 
         * @param command The command line as typed (e.g. "install latest")
         */
        void log_command(const std::string& command);

        /**
         * @brief Log an action performed
         * 
         * @param action Description of the action
         * @param details Additional details (optional)
         */
        void log_action(const std::string& action, const std::string& details = "");

        /**
         * @brief Log a recoverable problem
         * 
         * @param warning Warning message
         */
        void log_warning(const std::string& warning);

        /**
         * @brief Log an error
         * 
         * @param error Error message
         * @param context Context where error occurred
         */
        void log_error(const std::string& error, const std::string& context = "");

        /**
         * @brief Log a successful operation
         * 
         * @param operation Description of what succeeded
         * @param details Additional details (optional)
         */
        void log_success(const std::string& operation, const std::string& details = "");

        void log_info(const std::string& message);

        [[nodiscard]] std::filesystem::path get_log_path() const { return audit_log_path_; }

        /**
         * @brief Get last N lines of the audit log
         * 
         * @param n Number of lines to retrieve
         * @return std::string The last N lines, each terminated by '\n'
         */
        [[nodiscard]] std::string get_last_lines(size_t n = 50) const;

    private:
        std::filesystem::path logs_dir_;
        std::filesystem::path audit_log_path_;
        std::ofstream log_file_;
        mutable std::mutex mutex_;

        /**
         * @brief Get current timestamp string
         * 
         * @return std::string Formatted timestamp YYYY-MM-DD HH:MM:SS
         */
        [[nodiscard]] static std::string get_timestamp();

        [[nodiscard]] static std::string category_to_string(AuditCategory category);

        void write_log(AuditCategory category, const std::string& message);

        void ensure_open();
    };

} // namespace wbvm
