#pragma once

#include "motd/common/json.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>

namespace motd::config {

std::optional<motd::json::Value> LoadJsonFile(const std::filesystem::path &path,
                                              const std::string &label,
                                              spdlog::level::level_enum missingLevel);

// Dotted lookup ("query.TimeoutMs"); nullptr when any segment is missing.
const motd::json::Value *ResolvePath(const motd::json::Value &root, std::string_view path);

bool ReadBoolConfig(const motd::json::Value &root, const char *path, bool defaultValue);
uint16_t ReadUInt16Config(const motd::json::Value &root, const char *path, uint16_t defaultValue);
uint32_t ReadUInt32Config(const motd::json::Value &root, const char *path, uint32_t defaultValue);

} // namespace motd::config
