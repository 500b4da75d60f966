#pragma once

#include "export.h"
#include <string>

namespace StreamVault {

class SV_API Logging {
public:
    /// Настроить логгер по умолчанию (stdout, цветной вывод)
    /// @param level trace|debug|info|warn|error|critical|off
    static void initialize(const std::string& level, const std::string& pattern = "");

    /// Сменить уровень на лету
    static void setLevel(const std::string& level);
};

} // namespace StreamVault
