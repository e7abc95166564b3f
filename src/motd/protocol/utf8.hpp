#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace motd::protocol {

// Decodes UTF-8, replacing every maximal invalid subsequence with U+FFFD.
std::string DecodeUtf8Lossy(const uint8_t *data, std::size_t size);

} // namespace motd::protocol
