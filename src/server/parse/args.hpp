#ifndef _ARGS_H
#define _ARGS_H

#include "../utils/log.hpp"

#include <argp.h>

// 解析命令行参数
error_t parse_args(int argc, char* argv[]);

#endif
