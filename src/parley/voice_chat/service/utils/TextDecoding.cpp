#include "parley/voice_chat/service/utils/TextDecoding.h"

#include <cstddef>
#include <cstdint>

namespace parley::voice_chat::service::utils {

namespace {

constexpr char kReplacement[] = "\xEF\xBF\xBD";

struct LeadInfo {
    std::size_t continuationCount{0};
    std::uint8_t secondLow{0x80};
    std::uint8_t secondHigh{0xBF};
    bool valid{false};
};

LeadInfo classifyLead(std::uint8_t b) {
    if (b >= 0xC2 && b <= 0xDF) return {1, 0x80, 0xBF, true};
    if (b == 0xE0) return {2, 0xA0, 0xBF, true};
    if ((b >= 0xE1 && b <= 0xEC) || b == 0xEE || b == 0xEF) return {2, 0x80, 0xBF, true};
    if (b == 0xED) return {2, 0x80, 0x9F, true}; // 排除代理区
    if (b == 0xF0) return {3, 0x90, 0xBF, true};
    if (b >= 0xF1 && b <= 0xF3) return {3, 0x80, 0xBF, true};
    if (b == 0xF4) return {3, 0x80, 0x8F, true};
    return {};
}

// 返回从 pos 起合法序列的长度；非法时返回 0，并在 consumed 中给出应整体替换的字节数
std::size_t scanSequence(std::string_view bytes, std::size_t pos, std::size_t& consumed) {
    const auto lead = static_cast<std::uint8_t>(bytes[pos]);
    if (lead < 0x80) {
        consumed = 1;
        return 1;
    }
    const auto info = classifyLead(lead);
    if (!info.valid) {
        consumed = 1;
        return 0;
    }

    std::size_t i = 1;
    for (; i <= info.continuationCount; ++i) {
        if (pos + i >= bytes.size()) {
            consumed = i;
            return 0;
        }
        const auto b = static_cast<std::uint8_t>(bytes[pos + i]);
        const std::uint8_t low = (i == 1) ? info.secondLow : 0x80;
        const std::uint8_t high = (i == 1) ? info.secondHigh : 0xBF;
        if (b < low || b > high) {
            consumed = i;
            return 0;
        }
    }
    consumed = i;
    return i;
}

} // namespace

std::string decodeUtf8Lossy(std::string_view bytes) {
    std::string out;
    out.reserve(bytes.size());

    std::size_t pos = 0;
    while (pos < bytes.size()) {
        std::size_t consumed = 0;
        const auto len = scanSequence(bytes, pos, consumed);
        if (len > 0) {
            out.append(bytes.data() + pos, len);
        } else {
            out += kReplacement;
        }
        pos += consumed;
    }
    return out;
}

bool isValidUtf8(std::string_view bytes) {
    std::size_t pos = 0;
    while (pos < bytes.size()) {
        std::size_t consumed = 0;
        if (scanSequence(bytes, pos, consumed) == 0) return false;
        pos += consumed;
    }
    return true;
}

} // namespace parley::voice_chat::service::utils
