#ifndef ERRORCODE_HPP
#define ERRORCODE_HPP

#include <string>
#include <utility>

namespace ErrorCodes {

enum class Code : int {
    UNKNOWN_ERROR = 0,

    // Directories (1200-1299)
    DIRECTORY_NOT_FOUND = 1210,
    DIRECTORY_INVALID = 1211,
    DIRECTORY_ACCESS_DENIED = 1212,

    // Configuration (1500-1599)
    CONFIG_SAVE_FAILED = 1502,
    CONFIG_INVALID_VALUE = 1503,

    // Validation (1600-1699)
    VALIDATION_INVALID_INPUT = 1600,
    VALIDATION_INVALID_FORMAT = 1601,
    VALIDATION_EMPTY_FIELD = 1602,
    VALIDATION_VALUE_OUT_OF_RANGE = 1603,

    // Rename (1800-1899)
    RENAME_NO_FILES = 1800,
    RENAME_INVALID_RULE = 1802
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

    // Code, message, resolution and technical context
    std::string get_full_details() const;
};

class ErrorCatalog {
public:
    static ErrorInfo get_error_info(Code code, const std::string& context = "");
    static const char* get_code_name(Code code);
};

} // namespace ErrorCodes

#endif // ERRORCODE_HPP
