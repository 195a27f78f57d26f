#pragma once
#include <string>

/**
 * @brief SHA-256 of a byte string as lower-case hex (64 characters, no prefix)
 */
std::string sha256_hex(const std::string& data);
