// SessionManager.h — Сессии к удалённому хранилищу с учётом rate limit
// Единственный владелец RemoteSession и единственный писатель CooldownWindow

#pragma once

#include "../export.h"
#include "../Types.h"
#include "CooldownWindow.h"
#include "RemoteStore.h"
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace StreamVault {

class CredentialStore;
class SessionManager;

// ═══════════════════════════════════════════════════════════
// Настройки
// ═══════════════════════════════════════════════════════════

struct SessionManagerOptions {
    SessionMode mode = SessionMode::Stateless;
    std::string sessionToken;                       // Сохранённая сессия (приоритет)
    std::string botToken;                           // Fallback: логин бота
    std::chrono::milliseconds timeout{30000};       // Таймаут сетевых вызовов
    bool transportThreadSafe = false;               // Можно ли не сериализовать вызовы
};

struct SessionStats {
    uint64_t connects = 0;              // Новых соединений
    uint64_t reuses = 0;                // Выдач тёплой сессии
    uint64_t releases = 0;              // Освобождений
    uint64_t cooldownRejections = 0;    // Отказов без сетевого вызова
    uint64_t rateLimitSignals = 0;      // Сигналов rate limit от хранилища
};

// ═══════════════════════════════════════════════════════════
// SessionLease — RAII-владение выданной сессией
// ═══════════════════════════════════════════════════════════

/// Освобождается ровно один раз: явно через release() или в деструкторе.
/// SessionManager должен пережить все выданные lease.
class SV_API SessionLease {
public:
    SessionLease() = default;
    ~SessionLease();

    SessionLease(SessionLease&& other) noexcept;
    SessionLease& operator=(SessionLease&& other) noexcept;

    SessionLease(const SessionLease&) = delete;
    SessionLease& operator=(const SessionLease&) = delete;

    RemoteSession* operator->() const { return m_session.get(); }
    RemoteSession& operator*() const { return *m_session; }
    RemoteSession* get() const { return m_session.get(); }
    explicit operator bool() const { return m_session != nullptr; }

    /// Сессия повреждена ошибкой транспорта — не возвращать в пул
    void markBroken() { m_broken = true; }
    bool isBroken() const { return m_broken; }

    /// Идемпотентно
    void release();

private:
    friend class SessionManager;
    SessionLease(SessionManager* owner, std::shared_ptr<RemoteSession> session);

    SessionManager* m_owner = nullptr;
    std::shared_ptr<RemoteSession> m_session;
    bool m_broken = false;
};

// ═══════════════════════════════════════════════════════════
// SessionManager
// ═══════════════════════════════════════════════════════════

class SV_API SessionManager {
public:
    SessionManager(std::shared_ptr<RemoteStoreConnector> connector,
                   SessionManagerOptions options,
                   std::shared_ptr<CooldownWindow> cooldown = std::make_shared<CooldownWindow>(),
                   std::shared_ptr<CredentialStore> credentials = nullptr);
    ~SessionManager();

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    /// Получить рабочую сессию.
    /// Пока активно окно cooldown — RateLimitedException без сетевого вызова.
    /// @throws RateLimitedException, RemoteAuthException, TransportTimeoutException
    SessionLease acquire();

    /// Вернуть сессию; безопасно вызывать повторно и после ошибок
    void release(SessionLease& lease);

    /// Хранилище сообщило о rate limit во время запроса (не при подключении)
    void noteRateLimited(int64_t retryAfterSeconds);

    /// Закрыть тёплую сессию
    void shutdown();

    SessionStats stats() const;
    SessionMode mode() const;
    const CooldownWindow& cooldown() const;

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace StreamVault
