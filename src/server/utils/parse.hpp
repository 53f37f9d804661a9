#ifndef _PARSE_H
#define _PARSE_H

#include "std.hpp"

// 按 C 字面量前缀选择进制 (0x 十六进制, 0 八进制), 整个字符串都必须是数字
bool parse_u64(const std::string& in, _u64_m& out);

#endif
