#ifndef _LOG_H
#define _LOG_H

#include "std.hpp"

#define NONE "\033[0m"
#define RED(a) "\033[31m" a NONE
#define GREEN(a) "\033[32m" a NONE
#define YELLO(a) "\033[33m" a NONE
#define BLUE(a) "\033[34m" a NONE
#define PURPLE(a) "\033[35m" a NONE

extern bool enable_debug;

class Log {
  public:
    template <typename... Args>
    static void log(const Args&... args) {
        if (enable_debug) print(args...);
    }

    template <typename... Args>
    static void warn(const Args&... args) {
        if (enable_debug) print(PURPLE("warn: "), args...);
    }

    template <typename... Args>
    static void error(const Args&... args) {
        print(RED("error: "), args...);
    }

    template <typename... Args>
    static void success(const Args&... args) {
        if (enable_debug) print(GREEN("success: "), args...);
    }

  private:
    // 抓取线程并发打印时不交错输出
    static std::mutex& mutex() {
        static std::mutex m;
        return m;
    }

    template <typename... Args>
    static void print(const Args&... args) {
        std::lock_guard<std::mutex> lock(mutex());
        (std::cout << ... << args);
    }
};

#endif
