#ifndef _STD_H
#define _STD_H

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

// macro
#define INIT_SUCCESS 0
#define INIT_FAILED -1
#define CONFIG_MISSING -2
#define CONFIG_INVALID -3
#define DUPLICATE_PROGRAM -4
#define LOAD_FAILED -5
#define PROBE_FAILED -6
#define ATTACH_FAILED -7

// type
typedef unsigned long long _u64_m;
typedef unsigned int       _u32_m;
typedef unsigned short     _u16_m;
typedef unsigned char      _u8_m;

#endif
