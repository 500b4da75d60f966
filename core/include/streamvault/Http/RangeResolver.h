// RangeResolver.h — Разбор заголовка Range и вычисление отдаваемого диапазона

#pragma once

#include "../export.h"
#include <cstdint>
#include <optional>
#include <string>

namespace StreamVault {

// ═══════════════════════════════════════════════════════════
// RangeSpec — конкретный диапазон ответа
// ═══════════════════════════════════════════════════════════

struct RangeSpec {
    uint64_t start = 0;
    uint64_t endInclusive = 0;
    bool isPartial = false;

    /// Количество байт диапазона (для непустого объекта)
    uint64_t length() const { return endInclusive - start + 1; }

    /// 200 или 206
    int httpStatus() const { return isPartial ? 206 : 200; }

    bool operator==(const RangeSpec& other) const {
        return start == other.start && endInclusive == other.endInclusive &&
               isPartial == other.isPartial;
    }
};

/// Вычислить диапазон по размеру объекта и (опциональному) заголовку Range.
///
/// - без заголовка: весь объект, isPartial = false
/// - bytes=S-E: пропущенный S -> 0, пропущенный E -> size-1, E обрезается до size-1
/// - bytes=-N (suffix), несколько диапазонов, другая единица или мусор:
///   заголовок игнорируется, отдаётся весь объект
///
/// @throws RangeNotSatisfiableException если start > end после обрезки
SV_API RangeSpec resolveRange(uint64_t totalSize, const std::optional<std::string>& rangeHeader);

/// "bytes <start>-<end>/<size>" для ответа 206
SV_API std::string formatContentRange(const RangeSpec& range, uint64_t totalSize);

/// "bytes */<size>" для ответа 416
SV_API std::string formatUnsatisfiedContentRange(uint64_t totalSize);

} // namespace StreamVault
