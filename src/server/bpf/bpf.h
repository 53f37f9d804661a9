#ifndef _BPF_H
#define _BPF_H

#include "vmlinux.h"
#include <bpf/bpf_core_read.h>
#include <bpf/bpf_helpers.h>
#include <bpf/bpf_tracing.h>

#define MAX_ENTRIES 10240

#define MAX_SLOTS 27 // 桶数

// 内核中的设备号 (高 12 位主设备号, 低 20 位次设备号)
#define MINORBITS 20
#define MINORMASK ((1U << MINORBITS) - 1)

// 主从设备号合并为用户态的 dev_t
#define MKDEV(ma, mi) ((mi & 0xff) | (ma << 8) | ((mi & ~0xff) << 12))

#define REQ_OP_BITS 8
#define REQ_OP_MASK ((1 << REQ_OP_BITS) - 1)

// 不存在时先插入初始值
static __always_inline void* lookup_or_try_init(void* map, const void* key, const void* init) {
    void* val;
    long  err;

    val = bpf_map_lookup_elem(map, key);

    if (val) return val;

    err = bpf_map_update_elem(map, key, init, BPF_NOEXIST);

    if (err && err != -17 /* EEXIST */) return 0;

    return bpf_map_lookup_elem(map, key);
}

static __always_inline void increment(void* map, const void* key) {
    __u64  zero = 0;
    __u64* count;

    count = lookup_or_try_init(map, key, &zero);

    if (count) __sync_fetch_and_add(count, 1);
}

static __always_inline __u64 log2l(__u64 v) {
    __u64 r = 0;

    while (v > 1 && r < 63) {
        v >>= 1;
        r++;
    }

    return r;
}

#endif
