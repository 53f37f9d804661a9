#ifndef _DESCRIPTOR_H
#define _DESCRIPTOR_H

#include "metric.hpp"

#include <prometheus/metric_type.h>

// 所有指标名的前缀
#define METRIC_NAMESPACE "ebpf_exporter"

struct Descriptor {
    std::string name; // 带前缀的完整指标名
    std::string help;

    std::vector<std::string> labels;

    prometheus::MetricType type;
};

class DescriptorCache {
  public:
    // 不存在时按 metric 创建, 之后每次返回同一个对象
    std::shared_ptr<const Descriptor> get(const std::string& program, const Metric& metric, prometheus::MetricType type);

    size_t size() const;

  private:
    mutable std::mutex mutex;

    std::map<std::pair<std::string, std::string>, std::shared_ptr<const Descriptor>> descs;
};

#endif
