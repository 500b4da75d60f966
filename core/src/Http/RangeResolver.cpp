#include "streamvault/Http/RangeResolver.h"
#include "streamvault/Errors.h"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <limits>

namespace StreamVault {

namespace {

std::string trim(const std::string& s) {
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(begin, end - begin);
}

// Десятичное число с насыщением до UINT64_MAX; nullopt если есть не-цифры
std::optional<uint64_t> parsePosition(const std::string& s) {
    if (s.empty()) return std::nullopt;

    constexpr uint64_t MAX = std::numeric_limits<uint64_t>::max();
    uint64_t value = 0;
    for (char c : s) {
        if (c < '0' || c > '9') {
            return std::nullopt;
        }
        uint64_t digit = static_cast<uint64_t>(c - '0');
        if (value > (MAX - digit) / 10) {
            value = MAX;
        } else {
            value = value * 10 + digit;
        }
    }
    return value;
}

RangeSpec fullContent(uint64_t totalSize) {
    return RangeSpec{0, totalSize > 0 ? totalSize - 1 : 0, false};
}

} // namespace

RangeSpec resolveRange(uint64_t totalSize, const std::optional<std::string>& rangeHeader) {
    if (!rangeHeader) {
        return fullContent(totalSize);
    }

    const std::string header = trim(*rangeHeader);
    auto eqPos = header.find('=');
    if (eqPos == std::string::npos) {
        spdlog::debug("RangeResolver: Ignoring malformed Range '{}'", header);
        return fullContent(totalSize);
    }

    std::string unit = trim(header.substr(0, eqPos));
    std::transform(unit.begin(), unit.end(), unit.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    if (unit != "bytes") {
        spdlog::debug("RangeResolver: Ignoring unsupported range unit '{}'", unit);
        return fullContent(totalSize);
    }

    std::string set = trim(header.substr(eqPos + 1));
    if (set.find(',') != std::string::npos) {
        // Multi-range не поддерживается — отдаём весь объект
        spdlog::debug("RangeResolver: Multi-range '{}' served as full content", set);
        return fullContent(totalSize);
    }

    auto dashPos = set.find('-');
    if (dashPos == std::string::npos) {
        spdlog::debug("RangeResolver: Ignoring malformed Range '{}'", header);
        return fullContent(totalSize);
    }

    std::string startStr = trim(set.substr(0, dashPos));
    std::string endStr = trim(set.substr(dashPos + 1));

    if (startStr.empty() && !endStr.empty()) {
        // Suffix range (bytes=-N) не поддерживается
        spdlog::debug("RangeResolver: Suffix range '{}' served as full content", set);
        return fullContent(totalSize);
    }

    std::optional<uint64_t> start = startStr.empty() ? std::optional<uint64_t>(0)
                                                     : parsePosition(startStr);
    std::optional<uint64_t> end;
    if (!endStr.empty()) {
        end = parsePosition(endStr);
        if (!end) {
            spdlog::debug("RangeResolver: Ignoring malformed Range '{}'", header);
            return fullContent(totalSize);
        }
    }
    if (!start) {
        spdlog::debug("RangeResolver: Ignoring malformed Range '{}'", header);
        return fullContent(totalSize);
    }

    if (totalSize == 0) {
        throw RangeNotSatisfiableException(header, totalSize);
    }

    uint64_t last = totalSize - 1;
    uint64_t endInclusive = std::min(end.value_or(last), last);

    if (*start > endInclusive) {
        throw RangeNotSatisfiableException(header, totalSize);
    }

    return RangeSpec{*start, endInclusive, true};
}

std::string formatContentRange(const RangeSpec& range, uint64_t totalSize) {
    return "bytes " + std::to_string(range.start) + "-" +
           std::to_string(range.endInclusive) + "/" + std::to_string(totalSize);
}

std::string formatUnsatisfiedContentRange(uint64_t totalSize) {
    return "bytes */" + std::to_string(totalSize);
}

} // namespace StreamVault
