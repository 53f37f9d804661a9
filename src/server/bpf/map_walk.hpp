#ifndef _MAP_WALK_H
#define _MAP_WALK_H

#include "layout.hpp"
#include "module.hpp"

// 对一个 bpf 表的底层访问, 失败时返回 -errno
class MapCursor {
  public:
    virtual ~MapCursor() = default;

    // prev 为 nullptr 时取第一个键, 遍历结束返回 -ENOENT
    virtual int next_key(const void* prev, void* key) = 0;

    virtual int lookup(const void* key, void* value) = 0;
};

struct MapShape {
    std::string name;

    size_t key_size   = 0;
    size_t value_size = 0;
    size_t ncpus      = 1; // per-cpu 表为可能的 cpu 数
    size_t stride     = 0; // 每个 cpu 的值占用的字节数
};

// 遍历整张表, 除 -ENOENT 以外的任何失败都抛出 TableError
std::vector<TableEntry> walk_map(MapCursor& cursor, const MapShape& shape, const KeyLayout& layout);

#endif
