#pragma once

#include "../export.h"
#include <cstdint>
#include <memory>
#include <mutex>

namespace StreamVault {

// ═══════════════════════════════════════════════════════════
// Clock — источник времени (подменяется в тестах)
// ═══════════════════════════════════════════════════════════

class SV_API Clock {
public:
    virtual ~Clock() = default;
    virtual int64_t nowEpochSeconds() const = 0;
};

class SV_API SystemClock : public Clock {
public:
    int64_t nowEpochSeconds() const override;
};

// ═══════════════════════════════════════════════════════════
// CooldownWindow — окно, в течение которого нельзя открывать сессии
// ═══════════════════════════════════════════════════════════

class SV_API CooldownWindow {
public:
    explicit CooldownWindow(std::shared_ptr<Clock> clock = std::make_shared<SystemClock>());

    CooldownWindow(const CooldownWindow&) = delete;
    CooldownWindow& operator=(const CooldownWindow&) = delete;

    /// Сколько секунд осталось; 0 если окно неактивно
    int64_t remainingSeconds() const;

    bool isActive() const { return remainingSeconds() > 0; }

    /// Продлить до now + seconds. Окно никогда не сокращается.
    /// @return итоговая граница окна
    int64_t extend(int64_t seconds);

    int64_t untilEpochSeconds() const;

    const Clock& clock() const { return *m_clock; }

private:
    std::shared_ptr<Clock> m_clock;
    mutable std::mutex m_mutex;
    int64_t m_untilEpochSeconds = 0;
};

} // namespace StreamVault
