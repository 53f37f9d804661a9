#include "exporter.hpp"
#include "../utils/log.hpp"

Exporter::Exporter(std::vector<Program> programs, const Attacher& attacher, const DecoderSet& decoders)
    : programs(std::move(programs)), attacher(attacher), decoders(decoders) {}

std::vector<std::shared_ptr<const Descriptor>> Exporter::describe() const {
    std::vector<std::shared_ptr<const Descriptor>> result;

    for (auto p = programs.begin(); p != programs.end(); p++) {
        for (auto it = (*p).counters.begin(); it != (*p).counters.end(); it++) {
            result.push_back(descs.get((*p).name, *it, prometheus::MetricType::Counter));
        }

        for (auto it = (*p).histograms.begin(); it != (*p).histograms.end(); it++) {
            result.push_back(descs.get((*p).name, *it, prometheus::MetricType::Histogram));
        }
    }

    return result;
}

std::vector<prometheus::MetricFamily> Exporter::Collect() const {
    std::vector<prometheus::MetricFamily> families;

    collect_counters(families);
    collect_histograms(families);

    return families;
}

static prometheus::MetricFamily new_family(const Descriptor& desc) {
    prometheus::MetricFamily family;

    family.name = desc.name;
    family.help = desc.help;
    family.type = desc.type;

    return family;
}

static std::vector<prometheus::ClientMetric::Label> to_labels(const std::vector<std::string>& names,
                                                              const std::vector<std::string>& values) {
    std::vector<prometheus::ClientMetric::Label> labels;

    for (size_t i = 0; i < names.size() && i < values.size(); i++) {
        prometheus::ClientMetric::Label label;

        label.name  = names[i];
        label.value = values[i];

        labels.push_back(label);
    }

    return labels;
}

void Exporter::collect_counters(std::vector<prometheus::MetricFamily>& families) const {
    for (auto p = programs.begin(); p != programs.end(); p++) {
        const Program& program = *p;

        const Module* module = attacher.module(program.name);

        for (auto it = program.counters.begin(); it != program.counters.end(); it++) {
            const Counter& counter = *it;

            if (!module) {
                Log::error("Module for program ", program.name, " is not attached, skip ", counter.name, ".\n");
                continue;
            }

            std::vector<MetricValue> values;

            try {
                values = table_values(*module, counter.table, counter.labels, decoders);
            } catch (const TableError& e) {
                Log::error("Error getting table ", counter.table, " values for metric ", counter.name, " of program ",
                           program.name, ": ", e.what(), "\n");
                continue;
            }

            if (values.empty()) continue;

            auto desc = descs.get(program.name, counter, prometheus::MetricType::Counter);

            prometheus::MetricFamily family = new_family(*desc);

            for (auto v = values.begin(); v != values.end(); v++) {
                prometheus::ClientMetric metric;

                metric.label         = to_labels(desc->labels, (*v).labels);
                metric.counter.value = (*v).value;

                family.metric.push_back(metric);
            }

            families.push_back(family);
        }
    }
}

void Exporter::collect_histograms(std::vector<prometheus::MetricFamily>& families) const {
    for (auto p = programs.begin(); p != programs.end(); p++) {
        const Program& program = *p;

        const Module* module = attacher.module(program.name);

        for (auto it = program.histograms.begin(); it != program.histograms.end(); it++) {
            const Histogram& histogram = *it;

            if (!module) {
                Log::error("Module for program ", program.name, " is not attached, skip ", histogram.name, ".\n");
                continue;
            }

            std::vector<MetricValue> values;

            try {
                values = table_values(*module, histogram.table, histogram.table_labels(), decoders);
            } catch (const TableError& e) {
                Log::error("Error getting table ", histogram.table, " values for metric ", histogram.name, " of program ",
                           program.name, ": ", e.what(), "\n");
                continue;
            }

            std::vector<HistogramGroup> groups;

            // 任何一个桶无法解析, 整个直方图本轮都不上报
            try {
                groups = group_histogram(values);
            } catch (const HistogramError& e) {
                Log::error("Error parsing bucket in table ", histogram.table, " for metric ", histogram.name,
                           " of program ", program.name, ": ", e.what(), "\n");
                continue;
            }

            if (groups.empty()) continue;

            auto desc = descs.get(program.name, histogram, prometheus::MetricType::Histogram);

            prometheus::MetricFamily family = new_family(*desc);

            for (auto g = groups.begin(); g != groups.end(); g++) {
                CumulativeHistogram result;

                try {
                    result = transform_histogram((*g).buckets, histogram);
                } catch (const HistogramError& e) {
                    Log::error("Error transforming histogram for metric ", histogram.name, " in program ", program.name,
                               ": ", e.what(), "\n");
                    continue;
                }

                prometheus::ClientMetric metric;

                metric.label = to_labels(desc->labels, (*g).labels);

                // 只能拿到各个桶的计数, 无法还原总和, 也就没有 +Inf 桶,
                // bpf 程序需要自行把超出范围的值归入最后一个桶
                metric.histogram.sample_count = result.count;
                metric.histogram.sample_sum   = 0;

                for (auto b = result.buckets.begin(); b != result.buckets.end(); b++) {
                    prometheus::ClientMetric::Bucket bucket;

                    bucket.upper_bound      = (*b).upper_bound;
                    bucket.cumulative_count = (*b).cumulative_count;

                    metric.histogram.bucket.push_back(bucket);
                }

                family.metric.push_back(metric);
            }

            if (!family.metric.empty()) {
                families.push_back(family);
            }
        }
    }
}

Tables Exporter::tables() const {
    Tables result;

    for (auto p = programs.begin(); p != programs.end(); p++) {
        const Program& program = *p;

        const Module* module = attacher.module(program.name);

        if (!module) {
            throw TableError("module for program " + program.name + " is not attached");
        }

        std::map<std::string, std::vector<Label>> metric_tables;

        for (auto it = program.counters.begin(); it != program.counters.end(); it++) {
            if (!(*it).table.empty()) metric_tables[(*it).table] = (*it).table_labels();
        }

        for (auto it = program.histograms.begin(); it != program.histograms.end(); it++) {
            if (!(*it).table.empty()) metric_tables[(*it).table] = (*it).table_labels();
        }

        auto& tables = result[program.name];

        for (auto it = metric_tables.begin(); it != metric_tables.end(); it++) {
            try {
                tables[it->first] = table_values(*module, it->first, it->second, decoders);
            } catch (const TableError& e) {
                throw TableError("error getting values for table " + it->first + " of program " + program.name + ": " +
                                 e.what());
            }
        }
    }

    return result;
}
