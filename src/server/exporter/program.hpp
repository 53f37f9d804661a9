#ifndef _PROGRAM_H
#define _PROGRAM_H

#include "counter.hpp"
#include "histogram.hpp"

// 挂载点 -> 内核符号, 保留配置中的顺序
typedef std::vector<std::pair<std::string, std::string>> Probes;

class Program {
  public:
    std::string name;
    std::string object; // 编译好的 bpf 对象文件

    Probes kprobes;
    Probes kretprobes;

    std::vector<Counter>   counters;
    std::vector<Histogram> histograms;
};

#endif
