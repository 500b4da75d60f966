#include "streamvault/IdentifierCodec.h"
#include "streamvault/Errors.h"

namespace StreamVault {

namespace {

constexpr char HEX_DIGITS[] = "0123456789abcdef";
constexpr size_t MAX_TOKEN_DIGITS = 16;  // 64 бита

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

PublicToken IdentifierCodec::encode(ObjectId id) const {
    uint64_t value = id ^ m_secret;
    if (value == 0) {
        return "0";
    }

    std::string reversed;
    while (value != 0) {
        reversed.push_back(HEX_DIGITS[value & 0xF]);
        value >>= 4;
    }
    return std::string(reversed.rbegin(), reversed.rend());
}

ObjectId IdentifierCodec::decode(const PublicToken& token) const {
    if (token.empty() || token.size() > MAX_TOKEN_DIGITS) {
        throw InvalidTokenException(token);
    }

    uint64_t value = 0;
    for (char c : token) {
        int digit = hexValue(c);
        if (digit < 0) {
            throw InvalidTokenException(token);
        }
        value = (value << 4) | static_cast<uint64_t>(digit);
    }
    return value ^ m_secret;
}

} // namespace StreamVault
