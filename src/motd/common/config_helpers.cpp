#include "motd/common/config_helpers.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <limits>

namespace {

std::optional<unsigned long long> ReadUnsigned(const motd::json::Value &value, unsigned long long max) {
    if (value.is_number_unsigned()) {
        const auto number = value.get<unsigned long long>();
        if (number <= max) {
            return number;
        }
        return std::nullopt;
    }
    if (value.is_number_integer()) {
        const auto number = value.get<long long>();
        if (number >= 0 && static_cast<unsigned long long>(number) <= max) {
            return static_cast<unsigned long long>(number);
        }
        return std::nullopt;
    }
    if (value.is_string()) {
        try {
            const std::string text = value.get<std::string>();
            std::size_t consumed = 0;
            const auto number = std::stoull(text, &consumed);
            if (consumed == text.size() && text.front() != '-' && number <= max) {
                return number;
            }
        } catch (const std::exception &) {
            return std::nullopt;
        }
    }
    return std::nullopt;
}

} // namespace

namespace motd::config {

std::optional<motd::json::Value> LoadJsonFile(const std::filesystem::path &path,
                                              const std::string &label,
                                              spdlog::level::level_enum missingLevel) {
    if (!std::filesystem::exists(path)) {
        spdlog::log(missingLevel, "config: {} not found: {}", label, path.string());
        return std::nullopt;
    }

    std::ifstream stream(path);
    if (!stream) {
        spdlog::error("config: Failed to open {}: {}", label, path.string());
        return std::nullopt;
    }

    try {
        motd::json::Value json;
        stream >> json;
        return json;
    } catch (const std::exception &e) {
        spdlog::error("config: Failed to parse {}: {}", label, e.what());
        return std::nullopt;
    }
}

const motd::json::Value *ResolvePath(const motd::json::Value &root, std::string_view path) {
    if (path.empty()) {
        return &root;
    }

    const motd::json::Value *current = &root;
    std::size_t position = 0;
    while (position <= path.size()) {
        const std::size_t dot = path.find('.', position);
        const bool lastSegment = (dot == std::string_view::npos);
        const std::string segment(path.substr(position, lastSegment ? std::string_view::npos : dot - position));
        if (segment.empty() || !current->is_object()) {
            return nullptr;
        }

        const auto it = current->find(segment);
        if (it == current->end()) {
            return nullptr;
        }
        current = &(*it);

        if (lastSegment) {
            break;
        }
        position = dot + 1;
    }
    return current;
}

bool ReadBoolConfig(const motd::json::Value &root, const char *path, bool defaultValue) {
    const auto *value = ResolvePath(root, path);
    if (!value) {
        return defaultValue;
    }
    if (value->is_boolean()) {
        return value->get<bool>();
    }
    if (value->is_number_integer()) {
        return value->get<long long>() != 0;
    }
    if (value->is_string()) {
        std::string text = value->get<std::string>();
        std::transform(text.begin(), text.end(), text.begin(),
                       [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
        if (text == "true" || text == "1" || text == "yes" || text == "on") {
            return true;
        }
        if (text == "false" || text == "0" || text == "no" || text == "off") {
            return false;
        }
    }
    spdlog::warn("Config '{}' cannot be interpreted as boolean", path);
    return defaultValue;
}

uint16_t ReadUInt16Config(const motd::json::Value &root, const char *path, uint16_t defaultValue) {
    const auto *value = ResolvePath(root, path);
    if (!value) {
        return defaultValue;
    }
    const auto parsed = ReadUnsigned(*value, std::numeric_limits<uint16_t>::max());
    if (!parsed) {
        spdlog::warn("Config '{}' is not a valid uint16; falling back", path);
        return defaultValue;
    }
    if (*parsed == 0) {
        spdlog::warn("Config '{}' must be positive; falling back", path);
        return defaultValue;
    }
    return static_cast<uint16_t>(*parsed);
}

uint32_t ReadUInt32Config(const motd::json::Value &root, const char *path, uint32_t defaultValue) {
    const auto *value = ResolvePath(root, path);
    if (!value) {
        return defaultValue;
    }
    const auto parsed = ReadUnsigned(*value, std::numeric_limits<uint32_t>::max());
    if (!parsed) {
        spdlog::warn("Config '{}' is not a valid uint32; falling back", path);
        return defaultValue;
    }
    return static_cast<uint32_t>(*parsed);
}

} // namespace motd::config
