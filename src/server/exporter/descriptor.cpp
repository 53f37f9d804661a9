#include "descriptor.hpp"

std::shared_ptr<const Descriptor> DescriptorCache::get(const std::string& program, const Metric& metric,
                                                       prometheus::MetricType type) {
    std::lock_guard<std::mutex> lock(mutex);

    auto& desc = descs[{ program, metric.name }];

    if (!desc) {
        desc = std::make_shared<const Descriptor>(
            Descriptor{ std::string(METRIC_NAMESPACE) + "_" + metric.name, metric.help, metric.label_names(), type });
    }

    return desc;
}

size_t DescriptorCache::size() const {
    std::lock_guard<std::mutex> lock(mutex);

    return descs.size();
}
