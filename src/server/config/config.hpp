#ifndef _CONFIG_H
#define _CONFIG_H

#include "../exporter/program.hpp"

#include <yaml-cpp/yaml.h>

struct Config {
    std::string address     = "127.0.0.1";
    int         port        = 9435;
    int         tables_port = 0; // 0 表示不开启调试接口

    std::vector<Program> programs;
};

// 读取配置文件
error_t read_config(const std::string& path, Config& config);

// 解析已加载的 yaml
error_t parse_config(const YAML::Node& node, Config& config);

#endif
