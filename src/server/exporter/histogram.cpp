#include "histogram.hpp"
#include "../utils/parse.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

std::vector<Label> Histogram::table_labels() const {
    std::vector<Label> all = labels;

    all.push_back(bucket);

    return all;
}

std::vector<std::string> Histogram::label_names() const {
    return label_names_of(labels);
}

std::vector<_u64_m> Histogram::expected_keys() const {
    std::vector<_u64_m> keys;

    switch (type) {
    case E_EXP2:
    case E_LINEAR:
        for (int i = bucket_min; i <= bucket_max; i++) {
            keys.push_back(i);
        }
        break;
    case E_FIXED:
        keys = bucket_keys;
        std::sort(keys.begin(), keys.end());
        keys.erase(std::unique(keys.begin(), keys.end()), keys.end());
        break;
    }

    return keys;
}

double Histogram::upper_bound(_u64_m key) const {
    double le = type == E_EXP2 ? std::ldexp(1.0, static_cast<int>(key)) : static_cast<double>(key);

    return le * bucket_multiplier;
}

static std::string join(const std::vector<std::string>& labels) {
    std::ostringstream oss;

    oss << "[";

    for (size_t i = 0; i < labels.size(); i++) {
        if (i) oss << " ";
        oss << labels[i];
    }

    oss << "]";

    return oss.str();
}

// 以最后一个标签作为桶边界, 例如:
//
// 之前:
// * [sda, read, 1] -> 10
// * [sda, read, 2] -> 2
// * [sda, read, 4] -> 5
//
// 之后:
// * [sda, read] -> {1 -> 10, 2 -> 2, 4 -> 5}
std::vector<HistogramGroup> group_histogram(const std::vector<MetricValue>& values) {
    std::vector<HistogramGroup>                   groups;
    std::map<std::vector<std::string>, size_t> index;

    for (auto it = values.begin(); it != values.end(); it++) {
        const MetricValue& value = *it;

        if (value.labels.empty()) {
            throw HistogramError("row " + value.raw + " has no bucket label");
        }

        std::vector<std::string> labels(value.labels.begin(), value.labels.end() - 1);

        _u64_m le;

        if (!parse_u64(value.labels.back(), le)) {
            throw HistogramError("cannot parse bucket " + value.labels.back() + " of " + join(value.labels));
        }

        auto found = index.find(labels);

        if (found == index.end()) {
            found = index.emplace(labels, groups.size()).first;
            groups.push_back(HistogramGroup{ labels, {} });
        }

        // 重复的桶后写覆盖先写
        groups[found->second].buckets[le] = value.count;
    }

    return groups;
}

CumulativeHistogram transform_histogram(const std::map<_u64_m, _u64_m>& buckets, const Histogram& histogram) {
    CumulativeHistogram result;

    std::vector<_u64_m> keys = histogram.expected_keys();

    if (keys.empty()) {
        for (auto it = buckets.begin(); it != buckets.end(); it++) {
            keys.push_back(it->first);
        }
    } else {
        for (auto it = buckets.begin(); it != buckets.end(); it++) {
            if (!std::binary_search(keys.begin(), keys.end(), it->first)) {
                throw HistogramError("unexpected bucket " + std::to_string(it->first));
            }
        }
    }

    // keys 均为升序
    for (auto it = keys.begin(); it != keys.end(); it++) {
        auto found = buckets.find(*it);

        if (found != buckets.end()) {
            result.count += found->second;
        }

        result.buckets.push_back(CumulativeBucket{ histogram.upper_bound(*it), result.count });
    }

    return result;
}
