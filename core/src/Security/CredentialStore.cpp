#include "streamvault/CredentialStore.h"
#include <spdlog/spdlog.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>

namespace StreamVault {

namespace fs = std::filesystem;

std::string CredentialStore::defaultDirectory() {
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return std::string(home) + "/.config/streamvault/secure";
    }
    return "/tmp/streamvault/secure";
}

CredentialStore::CredentialStore(const std::string& directory)
    : m_storageDir(directory.empty() ? defaultDirectory() : directory) {
    std::error_code ec;
    fs::create_directories(m_storageDir, ec);
    if (ec) {
        spdlog::error("CredentialStore: Cannot create {}: {}", m_storageDir, ec.message());
    } else {
        fs::permissions(m_storageDir, fs::perms::owner_all, fs::perm_options::replace, ec);
    }
    spdlog::debug("CredentialStore: File-based storage at {}", m_storageDir);
}

CredentialStore::~CredentialStore() = default;

bool CredentialStore::store(const std::string& key, const std::vector<uint8_t>& data) {
    if (key.empty()) return false;

    std::string path = getPath(key);
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        spdlog::error("CredentialStore::store failed to open file for key '{}'", key);
        return false;
    }

    file.write(reinterpret_cast<const char*>(data.data()),
               static_cast<std::streamsize>(data.size()));
    file.close();
    if (!file) {
        spdlog::error("CredentialStore::store failed to write key '{}'", key);
        return false;
    }

    std::error_code ec;
    fs::permissions(path, fs::perms::owner_read | fs::perms::owner_write,
                    fs::perm_options::replace, ec);

    spdlog::debug("CredentialStore::store success for key '{}'", key);
    return true;
}

std::optional<std::vector<uint8_t>> CredentialStore::retrieve(const std::string& key) const {
    if (key.empty()) return std::nullopt;

    std::ifstream file(getPath(key), std::ios::binary | std::ios::ate);
    if (!file) {
        return std::nullopt;
    }

    auto size = file.tellg();
    if (size < 0) {
        return std::nullopt;
    }
    file.seekg(0, std::ios::beg);

    std::vector<uint8_t> result(static_cast<size_t>(size));
    file.read(reinterpret_cast<char*>(result.data()), size);
    return result;
}

bool CredentialStore::remove(const std::string& key) {
    if (key.empty()) return true;

    std::error_code ec;
    fs::remove(getPath(key), ec);
    return !ec;
}

bool CredentialStore::exists(const std::string& key) const {
    if (key.empty()) return false;
    return fs::exists(getPath(key));
}

bool CredentialStore::storeString(const std::string& key, const std::string& value) {
    return store(key, std::vector<uint8_t>(value.begin(), value.end()));
}

std::optional<std::string> CredentialStore::retrieveString(const std::string& key) const {
    auto data = retrieve(key);
    if (!data) return std::nullopt;
    return std::string(data->begin(), data->end());
}

std::string CredentialStore::getPath(const std::string& key) const {
    // Заменяем точки и разделители на подчёркивания для безопасного имени файла
    std::string safeKey = key;
    for (char& c : safeKey) {
        if (c == '.' || c == '/' || c == '\\') c = '_';
    }
    return m_storageDir + "/" + safeKey + ".dat";
}

} // namespace StreamVault
