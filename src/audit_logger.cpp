//
// Created by opencode on 17/10/2026.
//

#include "wbvm/audit_logger.hpp"
#include <iostream>
#include <deque>

namespace wbvm {

    AuditLogger::AuditLogger(const std::filesystem::path& logs_dir)
        : logs_dir_(logs_dir)
        , audit_log_path_(logs_dir / "wbvm.log") {
        std::error_code ec;
        std::filesystem::create_directories(logs_dir_, ec);
        
        log_file_.open(audit_log_path_, std::ios::app);
        
        if (!log_file_.is_open()) {
            std::cerr << "[AuditLogger] Failed to open audit log: " << audit_log_path_ << std::endl;
        }
    }

    AuditLogger::~AuditLogger() {
        if (log_file_.is_open()) {
            log_file_.close();
        }
    }

    void AuditLogger::log_command(const std::string& command) {
        write_log(AuditCategory::CMD, "Command received: " + command);
    }

    void AuditLogger::log_action(const std::string& action, const std::string& details) {
        std::string message = action;
        if (!details.empty()) {
            message += ": " + details;
        }
        write_log(AuditCategory::ACTION, message);
    }

    void AuditLogger::log_warning(const std::string& warning) {
        write_log(AuditCategory::WARNING, warning);
    }

    void AuditLogger::log_error(const std::string& error, const std::string& context) {
        std::string message = error;
        if (!context.empty()) {
            message = "[" + context + "] " + error;
        }
        write_log(AuditCategory::ERROR, message);
    }

    void AuditLogger::log_success(const std::string& operation, const std::string& details) {
        std::string message = operation;
        if (!details.empty()) {
            message += ": " + details;
        }
        write_log(AuditCategory::SUCCESS, message);
    }

    void AuditLogger::log_info(const std::string& message) {
        write_log(AuditCategory::INFO, message);
    }

    std::string AuditLogger::get_last_lines(size_t n) const {
        std::lock_guard<std::mutex> lock(mutex_);
        
        std::error_code ec;
        if (!std::filesystem::exists(audit_log_path_, ec)) {
            return "";
        }

        std::ifstream file(audit_log_path_);
        if (!file.is_open()) {
            return "";
        }

        std::deque<std::string> lines;
        std::string line;
        
        while (std::getline(file, line)) {
            lines.push_back(line);
            if (lines.size() > n) {
                lines.pop_front();
            }
        }
        
        std::string result;
        for (const auto& l : lines) {
            result += l + "\n";
        }
        
        return result;
    }

    std::string AuditLogger::get_timestamp() {
        auto now = std::chrono::system_clock::now();
        auto time = std::chrono::system_clock::to_time_t(now);
        
        std::stringstream ss;
        ss << std::put_time(std::localtime(&time), "%Y-%m-%d %H:%M:%S");
        return ss.str();
    }

    std::string AuditLogger::category_to_string(AuditCategory category) {
        switch (category) {
            case AuditCategory::CMD:     return "[CMD]";
            case AuditCategory::ACTION:  return "[ACTION]";
            case AuditCategory::WARNING: return "[WARNING]";
            case AuditCategory::ERROR:   return "[ERROR]";
            case AuditCategory::SUCCESS: return "[SUCCESS]";
            case AuditCategory::INFO:    return "[INFO]";
            default:                     return "[UNKNOWN]";
        }
    }

    void AuditLogger::write_log(AuditCategory category, const std::string& message) {
        std::lock_guard<std::mutex> lock(mutex_);
        
        ensure_open();
        
        if (log_file_.is_open()) {
            log_file_ << "[" << get_timestamp() << "] "
                     << category_to_string(category) << " "
                     << message << std::endl;
        }
    }

    void AuditLogger::ensure_open() {
        if (!log_file_.is_open()) {
            log_file_.open(audit_log_path_, std::ios::app);
        }
    }

} // namespace wbvm
