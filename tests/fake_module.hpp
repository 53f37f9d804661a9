#ifndef _FAKE_MODULE_H
#define _FAKE_MODULE_H

#include "bpf/module.hpp"
#include "exporter/program.hpp"

#include <atomic>
#include <set>

// 表名 -> 表中的行, 测试可以在两次抓取之间修改
typedef std::map<std::string, std::vector<TableEntry>> FakeTables;

class FakeTable : public Table {
  public:
    explicit FakeTable(std::vector<TableEntry> rows) : rows(std::move(rows)) {}

    std::vector<TableEntry> entries() const override {
        return rows;
    }

  private:
    std::vector<TableEntry> rows;
};

class FakeModule : public Module {
  public:
    std::shared_ptr<FakeTables> tables = std::make_shared<FakeTables>();

    std::vector<std::string> functions;   // 对象里存在的 bpf 函数
    std::set<std::string>    bad_symbols; // 插桩会失败的内核符号

    // 按顺序记录 "kprobe:<symbol>:<fd>"
    std::shared_ptr<std::vector<std::string>> events = std::make_shared<std::vector<std::string>>();

    std::shared_ptr<std::atomic<int>> reads = std::make_shared<std::atomic<int>>(0);

    error_t load_probe(const std::string& name, int* fd) override {
        for (size_t i = 0; i < functions.size(); i++) {
            if (functions[i] == name) {
                *fd = static_cast<int>(i) + 100;
                return 0;
            }
        }

        return -ENOENT;
    }

    error_t attach_kprobe(const std::string& symbol, int fd) override {
        return attach("kprobe", symbol, fd);
    }

    error_t attach_kretprobe(const std::string& symbol, int fd) override {
        return attach("kretprobe", symbol, fd);
    }

    std::unique_ptr<Table> open_table(const std::string& name, const std::vector<Label>&) const override {
        (*reads)++;

        auto found = tables->find(name);

        if (found == tables->end()) {
            throw TableError("there is no map named " + name);
        }

        return std::make_unique<FakeTable>(found->second);
    }

  private:
    error_t attach(const std::string& kind, const std::string& symbol, int fd) {
        if (bad_symbols.count(symbol)) return -EINVAL;

        events->push_back(kind + ":" + symbol + ":" + std::to_string(fd));

        return 0;
    }
};

class FakeLoader : public Loader {
  public:
    // 程序名 -> 打开后得到的模块模板, 不存在即加载失败
    std::map<std::string, FakeModule> modules;

    std::vector<std::string> opened;

    std::unique_ptr<Module> open(const Program& program) override {
        opened.push_back(program.name);

        auto found = modules.find(program.name);

        if (found == modules.end()) {
            return nullptr;
        }

        return std::make_unique<FakeModule>(found->second);
    }
};

inline Label make_label(const std::string& name, std::vector<Decoding> decoders = {}) {
    Label label;

    label.name     = name;
    label.decoders = std::move(decoders);

    return label;
}

inline Decoding make_decoding(const std::string& name) {
    Decoding d;

    d.name = name;

    return d;
}

#endif
