#ifndef HEADER_ERROR_HPP
#define HEADER_ERROR_HPP

#include <cstdint>
#include <string>

enum class HeaderErrorCode : uint8_t {
    FileNotFound = 1,
    PermissionDenied = 2,
    PayloadTooLarge = 3,
    TruncatedFile = 4,
    MalformedHeader = 5,
    IoError = 6,
    InvalidArgument = 7,
    InvalidConfig = 8
};

/**
 * @brief Error structure returned by every header operation.
 *
 * Carries the failure category, a descriptive message and, for the size
 * related failures, the offending and the permitted byte counts.
 */
struct HeaderError {
    HeaderErrorCode code;
    std::string message;
    uint64_t actual = 0;
    uint64_t max = 0;

    static HeaderError fileNotFound(const std::string& path);
    static HeaderError permissionDenied(const std::string& path);
    static HeaderError payloadTooLarge(uint64_t actual, uint64_t max);
    static HeaderError truncatedFile(const std::string& path, uint64_t actual, uint64_t expected);
    static HeaderError malformedHeader(uint64_t actual, uint64_t expected);
    static HeaderError ioError(const std::string& message);

    std::string toString() const;
};

std::string headerErrorCodeName(HeaderErrorCode code);

#endif
