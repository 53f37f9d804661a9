#include "map_walk.hpp"

// 值按无符号整数读取, per-cpu 表累加所有 cpu 的值
static _u64_m read_value(const char* p, size_t size) {
    if (size >= sizeof(_u64_m)) {
        _u64_m v;
        memcpy(&v, p, sizeof(v));
        return v;
    }

    if (size >= sizeof(_u32_m)) {
        _u32_m v;
        memcpy(&v, p, sizeof(v));
        return v;
    }

    throw TableError("value size " + std::to_string(size) + " is not supported");
}

std::vector<TableEntry> walk_map(MapCursor& cursor, const MapShape& shape, const KeyLayout& layout) {
    std::vector<TableEntry> entries;

    if (shape.key_size != layout.size) {
        throw TableError("table " + shape.name + " has " + std::to_string(shape.key_size) +
                         " bytes keys, but labels describe " + std::to_string(layout.size) + " bytes");
    }

    size_t stride = shape.stride ? shape.stride : shape.value_size;

    std::vector<char> prev(shape.key_size), key(shape.key_size), value(stride * shape.ncpus);

    void* last = nullptr;
    int   err;

    while ((err = cursor.next_key(last, key.data())) == 0) {
        int lerr = cursor.lookup(key.data(), value.data());

        if (lerr == 0) {
            _u64_m sum = 0;

            for (size_t i = 0; i < shape.ncpus; i++) {
                sum += read_value(value.data() + i * stride, shape.value_size);
            }

            entries.push_back(TableEntry{ layout.render(key.data(), key.size()), std::to_string(sum) });
        } else if (lerr != -ENOENT) {
            // 遍历期间被删除的键直接跳过
            throw TableError("failed to lookup table " + shape.name + ": " + std::string(strerror(-lerr)));
        }

        prev.swap(key);
        last = prev.data();
    }

    // 只有 ENOENT 表示走到了表尾, 其他错误说明结果不完整
    if (err != -ENOENT) {
        throw TableError("failed to iterate table " + shape.name + ": " + std::string(strerror(-err)));
    }

    return entries;
}
