#include "decoder.hpp"
#include "log.hpp"
#include "parse.hpp"

#include <arpa/inet.h>
#include <fstream>
#include <iterator>
#include <regex>
#include <sstream>
#include <sys/sysmacros.h>

static _u64_m to_u64(const std::string& in) {
    _u64_m v;

    if (!parse_u64(in, v)) {
        throw DecoderError("cannot parse " + in + " as uint64");
    }

    return v;
}

std::optional<std::string> UintDecoder::decode(const std::string& in, const Decoding&) {
    return std::to_string(to_u64(in));
}

static int hex_digit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

// 还原键中被转义为 \xHH 的字符
static std::string unescape(const std::string& in) {
    std::string out;

    for (size_t i = 0; i < in.size(); i++) {
        if (in[i] == '\\' && i + 3 < in.size() && in[i + 1] == 'x') {
            int hi = hex_digit(in[i + 2]);
            int lo = hex_digit(in[i + 3]);

            if (hi >= 0 && lo >= 0) {
                out += static_cast<char>(hi << 4 | lo);
                i += 3;
                continue;
            }
        }

        out += in[i];
    }

    return out;
}

std::optional<std::string> StringDecoder::decode(const std::string& in, const Decoding&) {
    if (in.size() >= 2 && in.front() == '"' && in.back() == '"') {
        return unescape(in.substr(1, in.size() - 2));
    }

    return unescape(in);
}

std::optional<std::string> StaticMapDecoder::decode(const std::string& in, const Decoding& conf) {
    if (conf.static_map.empty()) {
        Log::warn("Empty mapping.\n");

        return in;
    }

    auto found = conf.static_map.find(in);

    if (found != conf.static_map.end()) {
        return found->second;
    }

    return in;
}

const std::regex& RegexpDecoder::compile(const std::string& pattern) {
    std::lock_guard<std::mutex> lock(mutex);

    auto found = cache.find(pattern);

    if (found != cache.end()) {
        return found->second;
    }

    try {
        return cache.emplace(pattern, std::regex(pattern)).first->second;
    } catch (const std::regex_error& e) {
        throw DecoderError("invalid regexp " + pattern + ": " + e.what());
    }
}

std::optional<std::string> RegexpDecoder::decode(const std::string& in, const Decoding& conf) {
    for (auto it = conf.regexps.begin(); it != conf.regexps.end(); it++) {
        if (std::regex_search(in, compile(*it))) {
            return in;
        }
    }

    return std::nullopt;
}

size_t RegexpDecoder::compiled() const {
    std::lock_guard<std::mutex> lock(mutex);

    return cache.size();
}

std::optional<std::string> InetDecoder::decode(const std::string& in, const Decoding&) {
    _u32_m ip = static_cast<_u32_m>(to_u64(in));

    return inet(AF_INET, &ip);
}

std::string InetDecoder::inet(int af, const void* ip) {
    char buf[INET6_ADDRSTRLEN];

    union {
        struct in_addr  x4;
        struct in6_addr x6;
    } addr;

    switch (af) {
    case AF_INET: {
        memcpy(&addr.x4.s_addr, ip, sizeof(addr.x4.s_addr));
        inet_ntop(AF_INET, &addr, buf, INET_ADDRSTRLEN);
        break;
    }
    case AF_INET6: {
        memcpy(&addr.x6.s6_addr, ip, sizeof(addr.x6.s6_addr));
        inet_ntop(AF_INET6, &addr, buf, INET6_ADDRSTRLEN);
        break;
    }
    default:
        throw DecoderError("not support family " + std::to_string(af));
    }

    return std::string(buf);
}

std::optional<std::string> MajorMinorDecoder::decode(const std::string& in, const Decoding&) {
    dev_t dev = static_cast<dev_t>(to_u64(in));

    return std::to_string(major(dev)) + ":" + std::to_string(minor(dev));
}

KsymDecoder::KsymDecoder(std::string path) : path(std::move(path)) {}

// 只在第一次使用时读取 kallsyms
void KsymDecoder::load() {
    std::ifstream in(path);

    if (!in) {
        throw DecoderError("cannot open " + path);
    }

    std::string line;

    while (std::getline(in, line)) {
        std::istringstream iss(line);

        std::string addr, type, sym;

        if (!(iss >> addr >> type >> sym)) continue;

        _u64_m start;

        if (!parse_u64("0x" + addr, start) || start == 0) continue;

        symbols.emplace(start, sym);
    }

    loaded = true;
}

std::optional<std::string> KsymDecoder::decode(const std::string& in, const Decoding&) {
    _u64_m addr = to_u64(in);

    std::lock_guard<std::mutex> lock(mutex);

    if (!loaded) load();

    std::ostringstream oss;

    auto found = symbols.upper_bound(addr);

    if (found == symbols.begin()) {
        oss << "0x" << std::hex << addr;
        return oss.str();
    }

    return std::prev(found)->second;
}

DecoderSet::DecoderSet() {
    add("uint", std::make_unique<UintDecoder>());
    add("string", std::make_unique<StringDecoder>());
    add("static_map", std::make_unique<StaticMapDecoder>());
    add("regexp", std::make_unique<RegexpDecoder>());
    add("inet_ip", std::make_unique<InetDecoder>());
    add("majorminor", std::make_unique<MajorMinorDecoder>());
    add("ksym", std::make_unique<KsymDecoder>());
}

void DecoderSet::add(const std::string& name, std::unique_ptr<Decoder> decoder) {
    decoders[name] = std::move(decoder);
}

std::optional<std::string> DecoderSet::decode(const std::string& in, const Label& label) const {
    std::string value = in;

    for (auto it = label.decoders.begin(); it != label.decoders.end(); it++) {
        auto found = decoders.find((*it).name);

        if (found == decoders.end()) {
            throw DecoderError("unknown decoder " + (*it).name);
        }

        std::optional<std::string> decoded = found->second->decode(value, *it);

        if (!decoded) {
            return std::nullopt;
        }

        value = *decoded;
    }

    return value;
}
