#ifndef _LABEL_H
#define _LABEL_H

#include "../utils/std.hpp"

// 单个解码器配置, 参数只有对应的解码器关心
struct Decoding {
    std::string name;

    std::map<std::string, std::string> static_map;

    std::vector<std::string> regexps;
};

class Label {
  public:
    std::string           name;           // 标签名
    std::string           type = "u64";   // 键中字段的二进制类型
    std::vector<Decoding> decoders;       // 依次执行的解码器
};

#endif
