#ifndef APPEXCEPTION_HPP
#define APPEXCEPTION_HPP

#include "ErrorCode.hpp"
#include <stdexcept>
#include <string>

namespace ErrorCodes {

// Exception raised for unrecoverable setup failures (watcher, config)
class AppException : public std::runtime_error {
public:
    // Message and resolution come from the catalog
    explicit AppException(Code code, const std::string& context = "")
        : AppException(code, ErrorCatalog::get_error_info(code, context)) {}

    // Custom message, catalog resolution
    AppException(Code code, const std::string& custom_message, const std::string& context)
        : AppException(code, ErrorInfo(code,
                                       custom_message,
                                       ErrorCatalog::get_error_info(code).resolution,
                                       context)) {}

    Code get_error_code() const noexcept { return error_code_; }

    const ErrorInfo& get_error_info() const noexcept { return error_info_; }

    std::string get_full_details() const { return error_info_.get_full_details(); }

    int get_error_code_int() const noexcept { return static_cast<int>(error_code_); }

private:
    AppException(Code code, ErrorInfo info)
        : std::runtime_error(info.get_user_message()),
          error_code_(code),
          error_info_(std::move(info)) {}

    Code error_code_;
    ErrorInfo error_info_;
};

} // namespace ErrorCodes

#define THROW_APP_ERROR(code, context) \
    throw ErrorCodes::AppException(code, context)

#define THROW_APP_ERROR_MSG(code, message, context) \
    throw ErrorCodes::AppException(code, message, context)

#endif // APPEXCEPTION_HPP
