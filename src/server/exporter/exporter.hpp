#ifndef _EXPORTER_H
#define _EXPORTER_H

#include "attacher.hpp"
#include "descriptor.hpp"
#include "table.hpp"

#include <prometheus/collectable.h>
#include <prometheus/metric_family.h>

// 程序名 -> 表名 -> 表中的行
typedef std::map<std::string, std::map<std::string, std::vector<MetricValue>>> Tables;

class Exporter : public prometheus::Collectable {
  public:
    Exporter(std::vector<Program> programs, const Attacher& attacher, const DecoderSet& decoders);

    // 返回所有可能上报的指标描述, 重复调用得到同一组对象
    std::vector<std::shared_ptr<const Descriptor>> describe() const;

    std::vector<prometheus::MetricFamily> Collect() const override;

    // 调试用, 读出每个程序引用到的全部表, 失败抛出 TableError
    Tables tables() const;

    const std::vector<Program>& get_programs() const {
        return programs;
    }

  private:
    std::vector<Program> programs;

    const Attacher&   attacher;
    const DecoderSet& decoders;

    mutable DescriptorCache descs;

    void collect_counters(std::vector<prometheus::MetricFamily>& families) const;

    void collect_histograms(std::vector<prometheus::MetricFamily>& families) const;
};

#endif
