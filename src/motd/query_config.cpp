#include "motd/query_config.hpp"

#include "motd/common/config_helpers.hpp"

namespace motd::config {

QueryOptions ReadQueryOptions(const motd::json::Value &root, const QueryOptions &base) {
    QueryOptions options = base;
    options.timeout = std::chrono::milliseconds(
        ReadUInt32Config(root, "query.TimeoutMs", static_cast<uint32_t>(base.timeout.count())));
    options.validateMagic = ReadBoolConfig(root, "query.ValidateMagic", base.validateMagic);
    options.defaultPort = ReadUInt16Config(root, "query.DefaultPort", base.defaultPort);
    return options;
}

} // namespace motd::config
