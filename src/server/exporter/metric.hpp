#ifndef _METRIC_H
#define _METRIC_H

#include "label.hpp"

// 从内核表中读出的一行
struct MetricValue {
    std::string raw; // 内核给出的原始键

    std::vector<std::string> labels; // 按 Label 顺序解码后的值

    _u64_m count = 0; // 表中的原始计数

    double value = 0; // 导出用, 超过 2^53 会丢失精度
};

inline std::vector<std::string> label_names_of(const std::vector<Label>& labels) {
    std::vector<std::string> names;

    for (auto it = labels.begin(); it != labels.end(); it++) {
        names.push_back((*it).name);
    }

    return names;
}

class Metric {
  public:
    std::string name;
    std::string help;
    std::string table;

    virtual ~Metric() = default;

    // 读表时使用的全部标签
    virtual std::vector<Label> table_labels() const = 0;

    // 导出时使用的标签名
    virtual std::vector<std::string> label_names() const = 0;
};

#endif
