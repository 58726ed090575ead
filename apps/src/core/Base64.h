#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace BjornManager {

std::string base64Encode(const unsigned char* data, size_t length);

// Standard alphabet, padding optional. Returns nullopt on characters outside the alphabet.
std::optional<std::string> base64Decode(const std::string& text);

} // namespace BjornManager
