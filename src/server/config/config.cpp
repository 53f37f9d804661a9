#include "config.hpp"
#include "../utils/log.hpp"

static Probes parse_probes(const YAML::Node& node) {
    Probes probes;

    if (!node) return probes;

    for (auto it = node.begin(); it != node.end(); it++) {
        probes.push_back({ it->first.as<std::string>(), it->second.as<std::string>() });
    }

    return probes;
}

static Label parse_label(const YAML::Node& node) {
    Label label;

    label.name = node["name"] ? node["name"].as<std::string>() : "unknown";

    if (node["type"]) {
        label.type = node["type"].as<std::string>();
    }

    auto& ds = node["decoders"];

    for (size_t i = 0; ds && i < ds.size(); i++) {
        Decoding d;

        d.name = ds[i]["name"].as<std::string>();

        if (ds[i]["static_map"]) {
            d.static_map = ds[i]["static_map"].as<std::map<std::string, std::string>>();
        }

        if (ds[i]["regexps"]) {
            d.regexps = ds[i]["regexps"].as<std::vector<std::string>>();
        }

        label.decoders.push_back(d);
    }

    return label;
}

static void parse_metric(const YAML::Node& node, Metric& metric, std::vector<Label>& labels) {
    metric.name  = node["name"] ? node["name"].as<std::string>() : "unknown";
    metric.table = node["table"] ? node["table"].as<std::string>() : "";

    if (node["help"]) {
        metric.help = node["help"].as<std::string>();
    } else if (node["description"]) {
        metric.help = node["description"].as<std::string>();
    } else {
        metric.help = "not description";
    }

    auto& ls = node["labels"];

    for (size_t i = 0; ls && i < ls.size(); i++) {
        labels.push_back(parse_label(ls[i]));
    }
}

static Counter parse_counter(const YAML::Node& node) {
    Counter counter;

    parse_metric(node, counter, counter.labels);

    return counter;
}

static Histogram parse_histogram(const YAML::Node& node) {
    Histogram histogram;

    parse_metric(node, histogram, histogram.labels);

    if (histogram.labels.empty()) {
        throw std::invalid_argument("histogram " + histogram.name + " has no bucket label");
    }

    histogram.bucket = histogram.labels.back();
    histogram.labels.pop_back();

    std::string type = node["bucket_type"] ? node["bucket_type"].as<std::string>() : "fixed";

    if (type == "exp2") {
        histogram.type = E_EXP2;
    } else if (type == "linear") {
        histogram.type = E_LINEAR;
    } else if (type == "fixed") {
        histogram.type = E_FIXED;
    } else {
        throw std::invalid_argument("histogram " + histogram.name + " has unknown bucket type " + type);
    }

    histogram.bucket_min        = node["bucket_min"] ? node["bucket_min"].as<int>() : 0;
    histogram.bucket_max        = node["bucket_max"] ? node["bucket_max"].as<int>() : 0;
    histogram.bucket_multiplier = node["bucket_multiplier"] ? node["bucket_multiplier"].as<double>() : 1;

    if (node["bucket_keys"]) {
        histogram.bucket_keys = node["bucket_keys"].as<std::vector<_u64_m>>();
    }

    if (histogram.type != E_FIXED) {
        if (histogram.bucket_min < 0 || histogram.bucket_max < histogram.bucket_min) {
            throw std::invalid_argument("histogram " + histogram.name + " has invalid bucket range [" +
                                        std::to_string(histogram.bucket_min) + ", " +
                                        std::to_string(histogram.bucket_max) + "]");
        }
    }

    return histogram;
}

static Program parse_program(const YAML::Node& node) {
    Program program;

    program.name   = node["name"] ? node["name"].as<std::string>() : "unknown";
    program.object = node["object"] ? node["object"].as<std::string>() : "dist/" + program.name + ".bpf.o";

    program.kprobes    = parse_probes(node["kprobes"]);
    program.kretprobes = parse_probes(node["kretprobes"]);

    auto& metrics = node["metrics"];

    if (metrics && metrics["counters"]) {
        for (size_t i = 0; i < metrics["counters"].size(); i++) {
            program.counters.push_back(parse_counter(metrics["counters"][i]));
        }
    }

    if (metrics && metrics["histograms"]) {
        for (size_t i = 0; i < metrics["histograms"].size(); i++) {
            program.histograms.push_back(parse_histogram(metrics["histograms"][i]));
        }
    }

    return program;
}

error_t parse_config(const YAML::Node& config, Config& out) {
    try {
        // 获取端口号
        if (config["server"]) {
            auto& server = config["server"];

            if (server["address"]) out.address = server["address"].as<std::string>();
            if (server["port"]) out.port = server["port"].as<int>();
            if (server["tables_port"]) out.tables_port = server["tables_port"].as<int>();
        }

        auto p = config["programs"];

        // 初始化指标程序
        for (size_t i = 0; p && i < p.size(); i++) {
            out.programs.push_back(parse_program(p[i]));
        }
    } catch (const YAML::Exception& e) {
        Log::error("Invalid config: ", e.what(), "\n");
        return CONFIG_INVALID;
    } catch (const std::invalid_argument& e) {
        Log::error("Invalid config: ", e.what(), "\n");
        return CONFIG_INVALID;
    }

    return 0;
}

error_t read_config(const std::string& path, Config& config) {
    std::error_code ec;

    if (!std::filesystem::exists(path, ec)) {
        Log::error("Config file ", path, " does not exist.\n");
        return CONFIG_MISSING;
    }

    YAML::Node node;

    // 加载配置文件
    try {
        node = YAML::LoadFile(path);
    } catch (const YAML::Exception& e) {
        Log::error("Failed to parse config file ", path, ": ", e.what(), "\n");
        return CONFIG_INVALID;
    }

    return parse_config(node, config);
}
