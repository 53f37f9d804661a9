#ifndef _LIBBPF_MODULE_H
#define _LIBBPF_MODULE_H

#include "layout.hpp"
#include "map_walk.hpp"
#include "module.hpp"

#include <bpf/bpf.h>
#include <bpf/libbpf.h>

class LibbpfTable : public Table {
  public:
    LibbpfTable(const bpf_map* map, KeyLayout layout);

    std::vector<TableEntry> entries() const override;

  private:
    int    fd;
    bool   percpu;
    size_t key_size;
    size_t value_size;

    KeyLayout layout;

    std::string name;
};

class LibbpfModule : public Module {
  public:
    std::string name;

    explicit LibbpfModule(const std::string& name, bpf_object* obj);

    ~LibbpfModule();

    LibbpfModule(const LibbpfModule&) = delete;
    LibbpfModule& operator=(const LibbpfModule&) = delete;

    error_t load_probe(const std::string& name, int* fd) override;

    error_t attach_kprobe(const std::string& symbol, int fd) override;

    error_t attach_kretprobe(const std::string& symbol, int fd) override;

    std::unique_ptr<Table> open_table(const std::string& name, const std::vector<Label>& labels) const override;

  private:
    bpf_object* obj = nullptr;

    std::vector<bpf_link*> links;

    error_t attach(const std::string& symbol, int fd, bool retprobe);
};

class LibbpfLoader : public Loader {
  public:
    std::unique_ptr<Module> open(const Program& program) override;
};

#endif
