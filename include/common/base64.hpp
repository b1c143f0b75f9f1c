#pragma once

#include <string>

namespace executor {

/**
 * @brief 将任意字节串编码为标准 base64（带 = 填充）
 * 编码结果只包含 [A-Za-z0-9+/=]，可以安全地放进 shell 单引号中
 */
std::string base64_encode(const std::string &data);

/**
 * @brief 解码标准 base64
 * @param encoded 编码后的文本，遇到第一个非 base64 字符（包括 =）时停止
 */
std::string base64_decode(const std::string &encoded);

}  // namespace executor
