#include "utils/error.hpp"

namespace sync_http_client {
namespace utils {

const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::SUCCESS: return "SUCCESS";
        case ErrorCode::UNKNOWN_ERROR: return "UNKNOWN_ERROR";
        case ErrorCode::INVALID_ARGUMENT: return "INVALID_ARGUMENT";
        case ErrorCode::OPERATION_FAILED: return "OPERATION_FAILED";
        case ErrorCode::TIMEOUT: return "TIMEOUT";

        case ErrorCode::IO_ERROR: return "IO_ERROR";
        case ErrorCode::FILE_NOT_FOUND: return "FILE_NOT_FOUND";

        case ErrorCode::CONFIG_PARSE_ERROR: return "CONFIG_PARSE_ERROR";
        case ErrorCode::CONFIG_INVALID_VALUE: return "CONFIG_INVALID_VALUE";
        case ErrorCode::CONFIG_INVALID_LOG_LEVEL: return "CONFIG_INVALID_LOG_LEVEL";

        case ErrorCode::INVALID_URI: return "INVALID_URI";
        case ErrorCode::INVALID_METHOD: return "INVALID_METHOD";
        case ErrorCode::INVALID_HEADER_NAME: return "INVALID_HEADER_NAME";
        case ErrorCode::INVALID_HEADER_VALUE: return "INVALID_HEADER_VALUE";
        case ErrorCode::AMBIGUOUS_BODY_FRAMING: return "AMBIGUOUS_BODY_FRAMING";

        case ErrorCode::NETWORK_CONNECT_ERROR: return "NETWORK_CONNECT_ERROR";
        case ErrorCode::NETWORK_CLOSED: return "NETWORK_CLOSED";

        case ErrorCode::INVALID_STATUS_CODE: return "INVALID_STATUS_CODE";
        case ErrorCode::MALFORMED_STATUS_LINE: return "MALFORMED_STATUS_LINE";
        case ErrorCode::MALFORMED_HEADER_LINE: return "MALFORMED_HEADER_LINE";
        case ErrorCode::MALFORMED_CHUNK_SIZE: return "MALFORMED_CHUNK_SIZE";
        case ErrorCode::INVALID_CONTENT_LENGTH: return "INVALID_CONTENT_LENGTH";
        case ErrorCode::UNEXPECTED_EOF: return "UNEXPECTED_EOF";

        default: return "UNKNOWN_ERROR_CODE";
    }
}

const char* error_code_to_description(ErrorCode code) {
    switch (code) {
        case ErrorCode::SUCCESS: return "Operation completed successfully";
        case ErrorCode::UNKNOWN_ERROR: return "An unknown error occurred";
        case ErrorCode::INVALID_ARGUMENT: return "Invalid argument";
        case ErrorCode::OPERATION_FAILED: return "Operation failed";
        case ErrorCode::TIMEOUT: return "Operation timed out";

        case ErrorCode::IO_ERROR: return "I/O error";
        case ErrorCode::FILE_NOT_FOUND: return "File not found";

        case ErrorCode::CONFIG_PARSE_ERROR: return "Config parse error";
        case ErrorCode::CONFIG_INVALID_VALUE: return "Invalid config value";
        case ErrorCode::CONFIG_INVALID_LOG_LEVEL: return "Invalid log level";

        case ErrorCode::INVALID_URI: return "Invalid URI";
        case ErrorCode::INVALID_METHOD: return "Invalid or missing request method";
        case ErrorCode::INVALID_HEADER_NAME: return "Invalid header name";
        case ErrorCode::INVALID_HEADER_VALUE: return "Invalid header value";
        case ErrorCode::AMBIGUOUS_BODY_FRAMING: return "Body length unknown and chunked encoding not allowed";

        case ErrorCode::NETWORK_CONNECT_ERROR: return "Connect error";
        case ErrorCode::NETWORK_CLOSED: return "Connection closed by peer";

        case ErrorCode::INVALID_STATUS_CODE: return "Status code out of range";
        case ErrorCode::MALFORMED_STATUS_LINE: return "Malformed status line";
        case ErrorCode::MALFORMED_HEADER_LINE: return "Malformed header line";
        case ErrorCode::MALFORMED_CHUNK_SIZE: return "Malformed chunk size";
        case ErrorCode::INVALID_CONTENT_LENGTH: return "Invalid Content-Length";
        case ErrorCode::UNEXPECTED_EOF: return "Unexpected end of stream";

        default: return "Unknown error";
    }
}

ErrorCategory get_error_category(ErrorCode code) {
    int32_t value = static_cast<int32_t>(code);
    if (value == 0) {
        return ErrorCategory::NONE;
    }
    if (code == ErrorCode::TIMEOUT || code == ErrorCode::IO_ERROR) {
        return ErrorCategory::TRANSPORT;
    }
    if (value >= 4000 && value < 5000) {
        return ErrorCategory::TRANSPORT;
    }
    if (value >= 5000 && value < 6000) {
        return ErrorCategory::PROTOCOL;
    }
    return ErrorCategory::INPUT;
}

const char* error_category_to_string(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::NONE: return "NONE";
        case ErrorCategory::INPUT: return "INPUT";
        case ErrorCategory::TRANSPORT: return "TRANSPORT";
        case ErrorCategory::PROTOCOL: return "PROTOCOL";
        default: return "UNKNOWN";
    }
}

} // namespace utils
} // namespace sync_http_client
