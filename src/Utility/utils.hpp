#ifndef UTILS_HPP
#define UTILS_HPP

#include <cstdint>
#include <string>
#include <vector>
#include <expected>

#include "headerError.hpp"

// Accepts "0x"-prefixed hexadecimal or plain decimal, up to 0xFFFFFFFF
std::expected<uint32_t, HeaderError> parseU32(const std::string& text);

std::string toHex(uint32_t value);

void putU32LE(uint8_t* dst, uint32_t value);
uint32_t getU32LE(const uint8_t* src);

/**
 * @brief Work out why a path could not be opened.
 *
 * @return FileNotFound when nothing exists at the path, PermissionDenied otherwise
 */
HeaderError classifyOpenFailure(const std::string& path);

// Size from filesystem metadata, without reading the file
std::expected<uint64_t, HeaderError> fileSizeOf(const std::string& path);

std::expected<std::vector<uint8_t>, HeaderError> readFileBytes(const std::string& path);

#endif
