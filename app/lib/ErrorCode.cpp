#include "ErrorCode.hpp"

#include <sstream>

namespace ErrorCodes {

std::string ErrorInfo::get_user_message() const
{
    if (resolution.empty()) {
        return message;
    }
    return message + "\n" + resolution;
}

std::string ErrorInfo::get_full_details() const
{
    std::ostringstream oss;
    oss << "Error " << static_cast<int>(code) << " (" << ErrorCatalog::get_code_name(code) << "): "
        << message;
    if (!resolution.empty()) {
        oss << "\nResolution: " << resolution;
    }
    if (!context.empty()) {
        oss << "\nDetails: " << context;
    }
    return oss.str();
}

ErrorInfo ErrorCatalog::get_error_info(Code code, const std::string& context)
{
    switch (code) {
        case Code::DIRECTORY_NOT_FOUND:
            return {code, "The directory does not exist.",
                    "Select an existing directory.", context};
        case Code::DIRECTORY_INVALID:
            return {code, "The path is not a directory.",
                    "Select a directory rather than a file.", context};
        case Code::DIRECTORY_ACCESS_DENIED:
            return {code, "The directory cannot be read.",
                    "Check the permissions of the directory.", context};
        case Code::CONFIG_SAVE_FAILED:
            return {code, "The configuration could not be saved.",
                    "Check that the configuration directory is writable.", context};
        case Code::CONFIG_INVALID_VALUE:
            return {code, "A configuration value is invalid.",
                    "Correct the value and try again.", context};
        case Code::VALIDATION_INVALID_INPUT:
            return {code, "The input is invalid.",
                    "Correct the input and try again.", context};
        case Code::VALIDATION_INVALID_FORMAT:
            return {code, "The input has an invalid format.",
                    "Correct the format and try again.", context};
        case Code::VALIDATION_EMPTY_FIELD:
            return {code, "A required value is empty.",
                    "Provide a value and try again.", context};
        case Code::VALIDATION_VALUE_OUT_OF_RANGE:
            return {code, "A value is out of range.",
                    "Use a value within the allowed range.", context};
        case Code::RENAME_NO_FILES:
            return {code, "There are no files to rename.",
                    "Select a directory that contains files.", context};
        case Code::RENAME_INVALID_RULE:
            return {code, "The rename rule is invalid.",
                    "Review the rule options and try again.", context};
        case Code::UNKNOWN_ERROR:
        default:
            return {Code::UNKNOWN_ERROR, "An unexpected error occurred.", "", context};
    }
}

const char* ErrorCatalog::get_code_name(Code code)
{
    switch (code) {
        case Code::DIRECTORY_NOT_FOUND: return "DIRECTORY_NOT_FOUND";
        case Code::DIRECTORY_INVALID: return "DIRECTORY_INVALID";
        case Code::DIRECTORY_ACCESS_DENIED: return "DIRECTORY_ACCESS_DENIED";
        case Code::CONFIG_SAVE_FAILED: return "CONFIG_SAVE_FAILED";
        case Code::CONFIG_INVALID_VALUE: return "CONFIG_INVALID_VALUE";
        case Code::VALIDATION_INVALID_INPUT: return "VALIDATION_INVALID_INPUT";
        case Code::VALIDATION_INVALID_FORMAT: return "VALIDATION_INVALID_FORMAT";
        case Code::VALIDATION_EMPTY_FIELD: return "VALIDATION_EMPTY_FIELD";
        case Code::VALIDATION_VALUE_OUT_OF_RANGE: return "VALIDATION_VALUE_OUT_OF_RANGE";
        case Code::RENAME_NO_FILES: return "RENAME_NO_FILES";
        case Code::RENAME_INVALID_RULE: return "RENAME_INVALID_RULE";
        case Code::UNKNOWN_ERROR:
        default: return "UNKNOWN_ERROR";
    }
}

} // namespace ErrorCodes
