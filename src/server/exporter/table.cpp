#include "table.hpp"
#include "../utils/parse.hpp"

#include <sstream>

std::vector<std::string> split_key(const std::string& key) {
    static const char* trim = "{ }";

    std::string::size_type begin = key.find_first_not_of(trim);

    if (begin == std::string::npos) {
        return {};
    }

    std::string::size_type end = key.find_last_not_of(trim);

    std::istringstream iss(key.substr(begin, end - begin + 1));

    std::vector<std::string> elements;
    std::string              element;

    while (iss >> element) {
        elements.push_back(element);
    }

    return elements;
}

std::vector<MetricValue> table_values(const Module& module, const std::string& table, const std::vector<Label>& labels,
                                      const DecoderSet& decoders) {
    std::vector<MetricValue> values;

    std::unique_ptr<Table> t = module.open_table(table, labels);

    std::vector<TableEntry> entries = t->entries();

    for (auto it = entries.begin(); it != entries.end(); it++) {
        const TableEntry& entry = *it;

        std::vector<std::string> elements = split_key(entry.key);

        if (elements.size() != labels.size()) {
            throw TableError("key " + entry.key + " has " + std::to_string(elements.size()) + " elements, but we expect " +
                             std::to_string(labels.size()));
        }

        MetricValue mv;

        mv.raw = entry.key;

        bool skip = false;

        for (size_t i = 0; i < labels.size(); i++) {
            std::optional<std::string> decoded;

            try {
                decoded = decoders.decode(elements[i], labels[i]);
            } catch (const DecoderError& e) {
                throw TableError("error decoding " + elements[i] + " for label " + labels[i].name + ": " + e.what());
            }

            if (!decoded) {
                skip = true;
                break;
            }

            mv.labels.push_back(*decoded);
        }

        if (skip) continue;

        _u64_m value;

        if (!parse_u64(entry.value, value)) {
            throw TableError("value " + entry.value + " for key " + entry.key + " cannot be parsed as uint64");
        }

        mv.count = value;
        mv.value = static_cast<double>(value);

        values.push_back(mv);
    }

    return values;
}
