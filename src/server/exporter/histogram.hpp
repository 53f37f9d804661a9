#ifndef _HISTOGRAM_H
#define _HISTOGRAM_H

#include "metric.hpp"

class HistogramError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

enum BUCKET_TYPE {
    E_FIXED,
    E_EXP2,
    E_LINEAR,
};

class Histogram : public Metric {
  public:
    std::vector<Label> labels; // 分组标签
    Label              bucket; // 最后一个字段, 桶的边界

    BUCKET_TYPE type = E_FIXED;

    int    bucket_min        = 0;
    int    bucket_max        = 0;
    double bucket_multiplier = 1;

    std::vector<_u64_m> bucket_keys;

    std::vector<Label> table_labels() const override;

    std::vector<std::string> label_names() const override;

    // 期望出现的桶, 为空表示以实际读到的为准
    std::vector<_u64_m> expected_keys() const;

    // 表中的桶 -> 导出的 le
    double upper_bound(_u64_m key) const;
};

// 一组标签下各个桶的原始计数
struct HistogramGroup {
    std::vector<std::string> labels;

    std::map<_u64_m, _u64_m> buckets;
};

struct CumulativeBucket {
    double upper_bound;
    _u64_m cumulative_count;
};

struct CumulativeHistogram {
    std::vector<CumulativeBucket> buckets;

    _u64_m count = 0;
};

// 按除最后一个标签以外的标签分组, 任意一行桶边界无法解析即抛出 HistogramError
std::vector<HistogramGroup> group_histogram(const std::vector<MetricValue>& values);

// 转换为累计桶, 失败时抛出 HistogramError
CumulativeHistogram transform_histogram(const std::map<_u64_m, _u64_m>& buckets, const Histogram& histogram);

#endif
