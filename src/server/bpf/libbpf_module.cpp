#include "libbpf_module.hpp"
#include "../exporter/program.hpp"
#include "../utils/log.hpp"

LibbpfTable::LibbpfTable(const bpf_map* map, KeyLayout layout) : layout(std::move(layout)) {
    fd         = bpf_map__fd(map);
    key_size   = bpf_map__key_size(map);
    value_size = bpf_map__value_size(map);
    name       = bpf_map__name(map);

    enum bpf_map_type type = bpf_map__type(map);

    percpu = type == BPF_MAP_TYPE_PERCPU_HASH || type == BPF_MAP_TYPE_PERCPU_ARRAY ||
             type == BPF_MAP_TYPE_LRU_PERCPU_HASH;
}

// libbpf 的返回值在不同版本下可能是 -1 或 -errno, 统一为 -errno
class LibbpfCursor : public MapCursor {
  public:
    explicit LibbpfCursor(int fd) : fd(fd) {}

    int next_key(const void* prev, void* key) override {
        return bpf_map_get_next_key(fd, prev, key) ? -errno : 0;
    }

    int lookup(const void* key, void* value) override {
        return bpf_map_lookup_elem(fd, key, value) ? -errno : 0;
    }

  private:
    int fd;
};

std::vector<TableEntry> LibbpfTable::entries() const {
    MapShape shape;

    shape.name       = name;
    shape.key_size   = key_size;
    shape.value_size = value_size;

    if (percpu) {
        int n = libbpf_num_possible_cpus();

        if (n < 0) {
            throw TableError("failed to get possible cpus: " + std::string(strerror(-n)));
        }

        shape.ncpus  = n;
        shape.stride = (value_size + 7) / 8 * 8;
    }

    LibbpfCursor cursor(fd);

    return walk_map(cursor, shape, layout);
}

LibbpfModule::LibbpfModule(const std::string& name, bpf_object* obj) : name(name), obj(obj) {}

LibbpfModule::~LibbpfModule() {
    for (auto it = links.begin(); it != links.end(); it++) {
        bpf_link__destroy(*it);
    }

    if (obj) {
        bpf_object__close(obj);
        Log::log(name, " bpf object is closed.\n");
    }
}

error_t LibbpfModule::load_probe(const std::string& func, int* fd) {
    bpf_program* prog = bpf_object__find_program_by_name(obj, func.c_str());

    if (!prog) {
        return -ENOENT;
    }

    *fd = bpf_program__fd(prog);

    return *fd < 0 ? *fd : 0;
}

error_t LibbpfModule::attach(const std::string& symbol, int fd, bool retprobe) {
    struct bpf_program* prog;

    bpf_object__for_each_program(prog, obj) {
        if (bpf_program__fd(prog) != fd) continue;

        bpf_link* link = bpf_program__attach_kprobe(prog, retprobe, symbol.c_str());

        long err = libbpf_get_error(link);

        if (err) {
            return static_cast<error_t>(err);
        }

        links.push_back(link);

        return 0;
    }

    return -ENOENT;
}

error_t LibbpfModule::attach_kprobe(const std::string& symbol, int fd) {
    return attach(symbol, fd, false);
}

error_t LibbpfModule::attach_kretprobe(const std::string& symbol, int fd) {
    return attach(symbol, fd, true);
}

std::unique_ptr<Table> LibbpfModule::open_table(const std::string& table, const std::vector<Label>& labels) const {
    const bpf_map* map = bpf_object__find_map_by_name(obj, table.c_str());

    if (!map) {
        throw TableError("there is no map named " + table + " in program " + name);
    }

    try {
        return std::make_unique<LibbpfTable>(map, KeyLayout(labels));
    } catch (const std::invalid_argument& e) {
        throw TableError(e.what());
    }
}

std::unique_ptr<Module> LibbpfLoader::open(const Program& program) {
    bpf_object* obj = bpf_object__open(program.object.c_str());

    if (libbpf_get_error(obj)) {
        Log::error("Failed to open ", program.name, " bpf object ", program.object, ".\n");
        return nullptr;
    }

    Log::success("Open ", program.name, " bpf object.\n");

    error_t err = bpf_object__load(obj);

    if (err) {
        Log::error("Failed to load ", program.name, " bpf object: ", strerror(-err), ".\n");
        bpf_object__close(obj);
        return nullptr;
    }

    Log::success("Load ", program.name, " bpf object.\n");

    return std::make_unique<LibbpfModule>(program.name, obj);
}
