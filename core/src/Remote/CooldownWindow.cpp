#include "streamvault/Remote/CooldownWindow.h"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>
#include <limits>
#include <stdexcept>

namespace StreamVault {

int64_t SystemClock::nowEpochSeconds() const {
    return std::chrono::duration_cast<std::chrono::seconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

CooldownWindow::CooldownWindow(std::shared_ptr<Clock> clock)
    : m_clock(std::move(clock)) {
    if (!m_clock) {
        throw std::invalid_argument("Clock instance is required");
    }
}

int64_t CooldownWindow::remainingSeconds() const {
    int64_t now = m_clock->nowEpochSeconds();
    std::lock_guard<std::mutex> lock(m_mutex);
    return std::max<int64_t>(0, m_untilEpochSeconds - now);
}

int64_t CooldownWindow::extend(int64_t seconds) {
    int64_t now = m_clock->nowEpochSeconds();
    std::lock_guard<std::mutex> lock(m_mutex);

    // Огромный Retry-After упирается в конец шкалы, без переполнения
    const int64_t headroom = std::numeric_limits<int64_t>::max() - std::max<int64_t>(0, now);
    int64_t candidate = now + std::clamp<int64_t>(seconds, 0, headroom);
    if (candidate > m_untilEpochSeconds) {
        m_untilEpochSeconds = candidate;
        spdlog::warn("CooldownWindow: Remote store cooldown until {} ({}s)",
                     m_untilEpochSeconds, seconds);
    }
    return m_untilEpochSeconds;
}

int64_t CooldownWindow::untilEpochSeconds() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_untilEpochSeconds;
}

} // namespace StreamVault
