#include "core/Base64.h"

namespace BjornManager {

namespace {

constexpr char kAlphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
                             "abcdefghijklmnopqrstuvwxyz"
                             "0123456789+/";

int decodeChar(char ch)
{
    if (ch >= 'A' && ch <= 'Z') return ch - 'A';
    if (ch >= 'a' && ch <= 'z') return ch - 'a' + 26;
    if (ch >= '0' && ch <= '9') return ch - '0' + 52;
    if (ch == '+') return 62;
    if (ch == '/') return 63;
    return -1;
}

} // namespace

std::string base64Encode(const unsigned char* data, size_t length)
{
    std::string encoded;
    encoded.reserve(((length + 2) / 3) * 4);

    size_t i = 0;
    while (i < length) {
        unsigned char in[3] = { 0, 0, 0 };
        const size_t bytes = (length - i) >= 3 ? 3 : (length - i);
        for (size_t j = 0; j < bytes; ++j) {
            in[j] = data[i + j];
        }

        const unsigned char out[4] = {
            static_cast<unsigned char>((in[0] & 0xfc) >> 2),
            static_cast<unsigned char>(((in[0] & 0x03) << 4) + ((in[1] & 0xf0) >> 4)),
            static_cast<unsigned char>(((in[1] & 0x0f) << 2) + ((in[2] & 0xc0) >> 6)),
            static_cast<unsigned char>(in[2] & 0x3f),
        };
        for (size_t j = 0; j < bytes + 1; ++j) {
            encoded += kAlphabet[out[j]];
        }
        if (bytes < 3) {
            encoded.append(3 - bytes, '=');
        }
        i += bytes;
    }

    return encoded;
}

std::optional<std::string> base64Decode(const std::string& text)
{
    std::string decoded;
    decoded.reserve(text.size() * 3 / 4);

    unsigned int buffer = 0;
    int bits = 0;
    for (const char ch : text) {
        if (ch == '=') {
            break;
        }
        const int value = decodeChar(ch);
        if (value < 0) {
            return std::nullopt;
        }
        buffer = (buffer << 6) | static_cast<unsigned int>(value);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            decoded.push_back(static_cast<char>((buffer >> bits) & 0xff));
        }
    }
    return decoded;
}

} // namespace BjornManager
