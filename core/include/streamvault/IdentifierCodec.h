#pragma once

#include "export.h"
#include "Types.h"
#include <cstdint>

namespace StreamVault {

/// Обратимая обфускация ObjectId <-> PublicToken.
/// id XOR secret, затем lowercase hex без префикса и без ведущих нулей.
/// Это не механизм контроля доступа.
class SV_API IdentifierCodec {
public:
    static constexpr uint64_t DEFAULT_SECRET = 742658931;

    explicit IdentifierCodec(uint64_t secret = DEFAULT_SECRET) : m_secret(secret) {}

    PublicToken encode(ObjectId id) const;

    /// @throws InvalidTokenException если токен не hex или не помещается в 64 бита
    ObjectId decode(const PublicToken& token) const;

    uint64_t secret() const { return m_secret; }

private:
    uint64_t m_secret;
};

} // namespace StreamVault
