#include "parse.hpp"

#include <cctype>
#include <cerrno>
#include <cstdlib>

bool parse_u64(const std::string& in, _u64_m& out) {
    if (in.empty() || in[0] == '-' || in[0] == '+' || isspace(static_cast<unsigned char>(in[0]))) {
        return false;
    }

    char* end = nullptr;

    errno = 0;

    unsigned long long v = strtoull(in.c_str(), &end, 0);

    if (errno != 0 || end != in.c_str() + in.size()) {
        return false;
    }

    out = v;

    return true;
}
