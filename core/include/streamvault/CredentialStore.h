// CredentialStore.h — Хранение долгоживущих секретов (токен сессии хранилища)
// Файловая реализация: один файл на ключ, права 0600

#pragma once

#include "export.h"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace StreamVault {

class SV_API CredentialStore {
public:
    /// @param directory Каталог хранилища; пусто — $HOME/.config/streamvault/secure
    explicit CredentialStore(const std::string& directory = "");
    ~CredentialStore();

    // Запрет копирования
    CredentialStore(const CredentialStore&) = delete;
    CredentialStore& operator=(const CredentialStore&) = delete;

    /// Сохранить бинарные данные
    /// @return true если успешно
    bool store(const std::string& key, const std::vector<uint8_t>& data);

    /// Получить данные или nullopt если ключа нет
    std::optional<std::vector<uint8_t>> retrieve(const std::string& key) const;

    /// Удалить ключ; true если удалён или не существовал
    bool remove(const std::string& key);

    bool exists(const std::string& key) const;

    bool storeString(const std::string& key, const std::string& value);
    std::optional<std::string> retrieveString(const std::string& key) const;

    const std::string& directory() const { return m_storageDir; }

    static std::string defaultDirectory();

    static constexpr const char* KEY_SESSION_TOKEN = "streamvault.session_token";

private:
    std::string m_storageDir;

    std::string getPath(const std::string& key) const;
};

} // namespace StreamVault
