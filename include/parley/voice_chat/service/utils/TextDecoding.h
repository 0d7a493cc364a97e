#pragma once

#include <string>
#include <string_view>

namespace parley::voice_chat::service::utils {

/**
 * @brief 将字节序列按 UTF-8 解码，非法序列替换为 U+FFFD
 *
 * 每个非法序列的最大有效前缀替换为一个 U+FFFD（与 WHATWG 解码器一致），合法部分原样保留。
 */
std::string decodeUtf8Lossy(std::string_view bytes);

/**
 * @brief 是否为合法 UTF-8
 */
bool isValidUtf8(std::string_view bytes);

} // namespace parley::voice_chat::service::utils
