#include "headerError.hpp"

#include <string>

using namespace std;

HeaderError HeaderError::fileNotFound(const string& path) {
    return HeaderError{HeaderErrorCode::FileNotFound, "File not found: " + path};
}

HeaderError HeaderError::permissionDenied(const string& path) {
    return HeaderError{HeaderErrorCode::PermissionDenied, "Permission denied: " + path};
}

HeaderError HeaderError::payloadTooLarge(uint64_t actual, uint64_t max) {
    return HeaderError{
        HeaderErrorCode::PayloadTooLarge,
        "File too large! Please rebuild your SPL with -Os. Maximum allowed size is " +
            to_string(max) + " bytes, got " + to_string(actual) + " bytes.",
        actual,
        max};
}

HeaderError HeaderError::truncatedFile(const string& path, uint64_t actual, uint64_t expected) {
    return HeaderError{
        HeaderErrorCode::TruncatedFile,
        "File " + path + " holds " + to_string(actual) + " bytes, a header needs " + to_string(expected),
        actual,
        expected};
}

HeaderError HeaderError::malformedHeader(uint64_t actual, uint64_t expected) {
    return HeaderError{
        HeaderErrorCode::MalformedHeader,
        "Header needs " + to_string(expected) + " bytes, got " + to_string(actual),
        actual,
        expected};
}

HeaderError HeaderError::ioError(const string& message) {
    return HeaderError{HeaderErrorCode::IoError, message};
}

string HeaderError::toString() const {
    return headerErrorCodeName(code) + ": " + message;
}

string headerErrorCodeName(HeaderErrorCode code) {
    switch (code) {
        case HeaderErrorCode::FileNotFound: return "FileNotFound";
        case HeaderErrorCode::PermissionDenied: return "PermissionDenied";
        case HeaderErrorCode::PayloadTooLarge: return "PayloadTooLarge";
        case HeaderErrorCode::TruncatedFile: return "TruncatedFile";
        case HeaderErrorCode::MalformedHeader: return "MalformedHeader";
        case HeaderErrorCode::IoError: return "IoError";
        case HeaderErrorCode::InvalidArgument: return "InvalidArgument";
        case HeaderErrorCode::InvalidConfig: return "InvalidConfig";
        default: return "Unknown";
    }
}
