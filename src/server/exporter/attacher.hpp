#ifndef _ATTACHER_H
#define _ATTACHER_H

#include "../bpf/module.hpp"
#include "program.hpp"

// 负责加载全部程序并插桩, 持有加载后的模块直到进程退出
class Attacher {
  public:
    explicit Attacher(Loader& loader);

    // 遇到第一个错误即停止, 已经挂载的程序不会回滚
    error_t attach(const std::vector<Program>& programs);

    error_t attach(const Program& program);

    // 未挂载返回 nullptr
    const Module* module(const std::string& name) const;

  private:
    Loader& loader;

    std::map<std::string, std::unique_ptr<Module>> modules;
};

#endif
