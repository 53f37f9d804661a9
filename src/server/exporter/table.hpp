#ifndef _TABLE_H
#define _TABLE_H

#include "../bpf/module.hpp"
#include "../utils/decoder.hpp"
#include "metric.hpp"

// 去掉键两侧的 "{ }" 并按空白切分
std::vector<std::string> split_key(const std::string& key);

// 读取并解码整张表, 任何一行出错都会抛出 TableError
std::vector<MetricValue> table_values(const Module& module, const std::string& table, const std::vector<Label>& labels,
                                      const DecoderSet& decoders);

#endif
