#include "utils.hpp"

#include <cctype>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iterator>
#include <limits>
#include <sstream>
#include <string>

using namespace std;

expected<uint32_t, HeaderError> parseU32(const string& text) {

    string digits = text;
    int base = 10;
    if (digits.starts_with("0x") || digits.starts_with("0X")) {
        digits = digits.substr(2);
        base = 16;
    }

    if (digits.empty()) {
        return unexpected(HeaderError{HeaderErrorCode::InvalidArgument, "Not a number: '" + text + "'"});
    }

    for (char c : digits) {
        bool ok = (base == 16) ? isxdigit(static_cast<unsigned char>(c)) : isdigit(static_cast<unsigned char>(c));
        if (!ok) {
            return unexpected(HeaderError{HeaderErrorCode::InvalidArgument, "Not a number: '" + text + "'"});
        }
    }

    unsigned long long value = 0;
    try {
        value = stoull(digits, nullptr, base);
    } catch (const out_of_range&) {
        return unexpected(HeaderError{HeaderErrorCode::InvalidArgument, "Value out of range for u32: " + text});
    }

    if (value > numeric_limits<uint32_t>::max()) {
        return unexpected(HeaderError{HeaderErrorCode::InvalidArgument, "Value out of range for u32: " + text});
    }

    return static_cast<uint32_t>(value);
}

string toHex(uint32_t value) {
    ostringstream oss;
    oss << "0x" << hex << value;
    return oss.str();
}

void putU32LE(uint8_t* dst, uint32_t value) {
    dst[0] = static_cast<uint8_t>(value);
    dst[1] = static_cast<uint8_t>(value >> 8);
    dst[2] = static_cast<uint8_t>(value >> 16);
    dst[3] = static_cast<uint8_t>(value >> 24);
}

uint32_t getU32LE(const uint8_t* src) {
    return static_cast<uint32_t>(src[0])
        | (static_cast<uint32_t>(src[1]) << 8)
        | (static_cast<uint32_t>(src[2]) << 16)
        | (static_cast<uint32_t>(src[3]) << 24);
}

HeaderError classifyOpenFailure(const string& path) {
    error_code ec;
    if (!filesystem::exists(path, ec)) {
        return HeaderError::fileNotFound(path);
    }
    return HeaderError::permissionDenied(path);
}

expected<uint64_t, HeaderError> fileSizeOf(const string& path) {

    error_code ec;
    if (!filesystem::exists(path, ec)) {
        return unexpected(HeaderError::fileNotFound(path));
    }
    if (filesystem::is_directory(path, ec)) {
        return unexpected(HeaderError::ioError(path + " is a directory"));
    }

    uintmax_t size = filesystem::file_size(path, ec);
    if (ec) {
        return unexpected(HeaderError::ioError("Failed to stat " + path + ": " + ec.message()));
    }
    return static_cast<uint64_t>(size);
}

expected<vector<uint8_t>, HeaderError> readFileBytes(const string& path) {

    error_code ec;
    if (filesystem::is_directory(path, ec)) {
        return unexpected(HeaderError::ioError(path + " is a directory"));
    }

    ifstream file(path, ios::binary);
    if (!file.is_open()) {
        return unexpected(classifyOpenFailure(path));
    }

    vector<uint8_t> contents{istreambuf_iterator<char>(file), istreambuf_iterator<char>()};
    if (file.bad()) {
        return unexpected(HeaderError::ioError("Failed to read " + path));
    }

    return contents;
}
