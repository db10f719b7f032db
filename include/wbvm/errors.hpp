/**
 * @file errors.hpp
 * @brief Error taxonomy for wbvm
 *
 * Every failure that aborts a command is reported as a WbvmError carrying
 * an ErrorKind. Catalog refresh failures are the exception: they are
 * recovered locally and reported as warnings (see ReleaseCatalog::refresh).
 */

#pragma once

#include <stdexcept>
#include <string>

namespace wbvm {

    /**
     * @brief Categories of terminal errors
     */
    enum class ErrorKind {
        CATALOG_UNAVAILABLE,    ///< No usable releases.json
        VERSION_NOT_FOUND,      ///< Token matches no catalog entry
        UNSUPPORTED_PLATFORM,   ///< Host/platform id outside the supported set
        ASSET_NOT_FOUND,        ///< Release has no archive for the platform
        VERSION_NOT_INSTALLED,  ///< Activation of a version that is not installed
        FETCH_FAILED,           ///< Network fetch failed
        EXTRACT_FAILED,         ///< Archive extraction failed
        FILESYSTEM_FAILED,      ///< mkdir/chmod/symlink/rename/rm failed
        CONFIG_INVALID          ///< Malformed config.json
    };

    inline std::string error_kind_to_string(ErrorKind kind) {
        switch (kind) {
            case ErrorKind::CATALOG_UNAVAILABLE:   return "CatalogUnavailable";
            case ErrorKind::VERSION_NOT_FOUND:     return "VersionNotFound";
            case ErrorKind::UNSUPPORTED_PLATFORM:  return "UnsupportedPlatform";
            case ErrorKind::ASSET_NOT_FOUND:       return "AssetNotFound";
            case ErrorKind::VERSION_NOT_INSTALLED: return "VersionNotInstalled";
            case ErrorKind::FETCH_FAILED:          return "FetchFailed";
            case ErrorKind::EXTRACT_FAILED:        return "ExtractFailed";
            case ErrorKind::FILESYSTEM_FAILED:     return "FilesystemFailed";
            case ErrorKind::CONFIG_INVALID:        return "ConfigInvalid";
            default:                               return "Unknown";
        }
    }

    /**
     * @brief Exception type for all terminal wbvm errors
     *
     * Usage:
     *   throw WbvmError(ErrorKind::VERSION_NOT_FOUND, "No release with name v1.0.0 found");
     *
     *   catch (const WbvmError& e) {
     *       if (e.kind() == ErrorKind::VERSION_NOT_FOUND) { ... }
     *   }
     */
    class WbvmError : public std::runtime_error {
    public:
        WbvmError(ErrorKind kind, const std::string& message)
            : std::runtime_error(message)
            , kind_(kind) {}

        [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

    private:
        ErrorKind kind_;
    };

} // namespace wbvm
