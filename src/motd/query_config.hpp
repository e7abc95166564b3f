#pragma once

#include "motd/common/json.hpp"
#include "motd/query_options.hpp"

namespace motd::config {

// Reads query.TimeoutMs, query.ValidateMagic and query.DefaultPort over `base`.
QueryOptions ReadQueryOptions(const motd::json::Value &root, const QueryOptions &base = {});

} // namespace motd::config
