#ifndef ERRORCODE_HPP
#define ERRORCODE_HPP

#include <string>
#include <utility>

namespace ErrorCodes {

/*
 * Error code ranges:
 *   File system   (1200-1299)
 *   Configuration (1500-1599)
 *   Watcher       (2000-2099)
 */
enum class Code {
    UNKNOWN_ERROR = 1,

    DIRECTORY_NOT_FOUND = 1210,

    CONFIG_SAVE_FAILED = 1503,
    CONFIG_INVALID_VALUE = 1505,
    CONFIG_DIRECTORY_FAILED = 1507,

    WATCHER_INIT_FAILED = 2000,
    WATCHER_ADD_FAILED = 2001,
    WATCHER_READ_FAILED = 2002,
};

struct ErrorInfo {
    Code code{Code::UNKNOWN_ERROR};
    std::string message;
    std::string resolution;
    std::string context;

    ErrorInfo() = default;
    ErrorInfo(Code code, std::string message, std::string resolution, std::string context = "")
        : code(code),
          message(std::move(message)),
          resolution(std::move(resolution)),
          context(std::move(context)) {}

    // Message followed by the resolution hint
    std::string get_user_message() const;

    // Code, message, resolution and technical context on separate lines
    std::string get_full_details() const;
};

class ErrorCatalog {
public:
    static ErrorInfo get_error_info(Code code, const std::string& context = "");
};

} // namespace ErrorCodes

#endif // ERRORCODE_HPP
