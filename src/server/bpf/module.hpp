#ifndef _MODULE_H
#define _MODULE_H

#include "../exporter/label.hpp"

class TableError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

// 内核表中的一项, 键形如 "{ 8388608 1 3 }"
struct TableEntry {
    std::string key;
    std::string value;
};

class Table {
  public:
    virtual ~Table() = default;

    // 每次调用都重新遍历, 反映内核当前状态
    virtual std::vector<TableEntry> entries() const = 0;
};

// 一个已加载的 bpf 程序对象
class Module {
  public:
    virtual ~Module() = default;

    // 按函数名查找 bpf 程序, 成功时写入其 fd
    virtual error_t load_probe(const std::string& name, int* fd) = 0;

    virtual error_t attach_kprobe(const std::string& symbol, int fd) = 0;

    virtual error_t attach_kretprobe(const std::string& symbol, int fd) = 0;

    // labels 描述键的字段布局, 找不到表时抛出 TableError
    virtual std::unique_ptr<Table> open_table(const std::string& name, const std::vector<Label>& labels) const = 0;
};

class Program;

class Loader {
  public:
    virtual ~Loader() = default;

    // 编译或加载程序的字节码, 失败返回 nullptr
    virtual std::unique_ptr<Module> open(const Program& program) = 0;
};

#endif
