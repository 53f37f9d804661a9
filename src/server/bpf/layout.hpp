#ifndef _LAYOUT_H
#define _LAYOUT_H

#include "../exporter/label.hpp"

enum TYPES {
    E_U64,
    E_U32,
    E_U16,
    E_U8,
    E_INT,
    E_SHORT,
    E_DOUBLE,
    E_CHAR,
};

struct Field {
    TYPES  type;
    size_t size   = 0; // 单个元素的字节数
    size_t count  = 1; // 数组长度, 非数组为 1
    size_t offset = 0;
    bool   array  = false;
};

// 按 C 结构体的自然对齐方式描述 bpf 表的键
class KeyLayout {
  public:
    std::vector<Field> fields;

    size_t size = 0; // 包含尾部填充

    // 不支持的类型抛出 std::invalid_argument
    explicit KeyLayout(const std::vector<Label>& labels);

    // 渲染为 "{ a b c }", 字符数组渲染为带引号的字符串, 其中空白转义为 \xHH
    std::string render(const void* key, size_t len) const;
};

#endif
