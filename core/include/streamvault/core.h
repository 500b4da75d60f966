#pragma once

namespace StreamVault {

constexpr const char* NAME = "StreamVault";
constexpr const char* VERSION = "2.0.0";

} // namespace StreamVault
