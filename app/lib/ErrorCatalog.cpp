#include "ErrorCode.hpp"

#include <sstream>

namespace ErrorCodes {

std::string ErrorInfo::get_user_message() const
{
    if (resolution.empty()) {
        return message;
    }
    return message + "\n\n" + resolution;
}

std::string ErrorInfo::get_full_details() const
{
    std::ostringstream oss;
    oss << "Error Code: " << static_cast<int>(code) << "\n"
        << "Message: " << message << "\n";
    if (!resolution.empty()) {
        oss << "Resolution: " << resolution << "\n";
    }
    if (!context.empty()) {
        oss << "Details: " << context << "\n";
    }
    return oss.str();
}

ErrorInfo ErrorCatalog::get_error_info(Code code, const std::string& context)
{
    switch (code) {
        case Code::DIRECTORY_NOT_FOUND:
            return {code, "The watched directory does not exist.",
                    "Create the directory or remove it from the [Roots] section of config.ini.", context};
        case Code::CONFIG_INVALID_VALUE:
            return {code, "The configuration contains an invalid value.",
                    "Edit config.ini or delete it to restore the defaults.", context};
        case Code::CONFIG_SAVE_FAILED:
            return {code, "The configuration could not be saved.",
                    "Check that the configuration directory is writable.", context};
        case Code::CONFIG_DIRECTORY_FAILED:
            return {code, "The configuration directory could not be created.",
                    "Check permissions of $HOME/.config or set READBAR_CONFIG_DIR.", context};
        case Code::WATCHER_INIT_FAILED:
            return {code, "File change notifications are unavailable.",
                    "Raise fs.inotify.max_user_instances; the list is still refreshed by rescans.", context};
        case Code::WATCHER_ADD_FAILED:
            return {code, "A directory could not be watched for changes.",
                    "Raise fs.inotify.max_user_watches or disable recursive watching for this root.", context};
        case Code::WATCHER_READ_FAILED:
            return {code, "Reading file change notifications failed.",
                    "Restart the application.", context};
        case Code::UNKNOWN_ERROR:
        default:
            return {Code::UNKNOWN_ERROR, "An unknown error occurred.", "", context};
    }
}

} // namespace ErrorCodes
