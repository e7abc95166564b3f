#include "motd/protocol/utf8.hpp"

namespace {

constexpr const char *REPLACEMENT_CHARACTER = "\xEF\xBF\xBD";

struct LeadByteRule {
    std::size_t continuationCount = 0;
    uint8_t secondMin = 0x80;
    uint8_t secondMax = 0xBF;
};

// Returns false for bytes that can never start a sequence.
bool ClassifyLeadByte(uint8_t lead, LeadByteRule &rule) {
    if (lead >= 0xC2 && lead <= 0xDF) {
        rule = {1, 0x80, 0xBF};
    } else if (lead == 0xE0) {
        rule = {2, 0xA0, 0xBF};
    } else if (lead == 0xED) {
        rule = {2, 0x80, 0x9F};
    } else if (lead >= 0xE1 && lead <= 0xEF) {
        rule = {2, 0x80, 0xBF};
    } else if (lead == 0xF0) {
        rule = {3, 0x90, 0xBF};
    } else if (lead >= 0xF1 && lead <= 0xF3) {
        rule = {3, 0x80, 0xBF};
    } else if (lead == 0xF4) {
        rule = {3, 0x80, 0x8F};
    } else {
        return false;
    }
    return true;
}

} // namespace

namespace motd::protocol {

std::string DecodeUtf8Lossy(const uint8_t *data, std::size_t size) {
    std::string result;
    result.reserve(size);

    std::size_t i = 0;
    while (i < size) {
        const uint8_t lead = data[i];
        if (lead < 0x80) {
            result.push_back(static_cast<char>(lead));
            ++i;
            continue;
        }

        LeadByteRule rule;
        if (!ClassifyLeadByte(lead, rule)) {
            result += REPLACEMENT_CHARACTER;
            ++i;
            continue;
        }

        std::size_t end = i + 1;
        bool valid = true;
        for (std::size_t k = 0; k < rule.continuationCount; ++k) {
            if (end >= size) {
                valid = false;
                break;
            }
            const uint8_t low = (k == 0) ? rule.secondMin : 0x80;
            const uint8_t high = (k == 0) ? rule.secondMax : 0xBF;
            if (data[end] < low || data[end] > high) {
                valid = false;
                break;
            }
            ++end;
        }

        if (!valid) {
            // The bytes consumed so far form one maximal invalid subpart.
            result += REPLACEMENT_CHARACTER;
            i = end;
            continue;
        }

        result.append(reinterpret_cast<const char *>(data + i), end - i);
        i = end;
    }

    return result;
}

} // namespace motd::protocol
