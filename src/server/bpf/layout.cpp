#include "layout.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

static const std::map<std::string, std::pair<TYPES, size_t>> type_map = {
    { "u64", { TYPES::E_U64, sizeof(_u64_m) } },
    { "u32", { TYPES::E_U32, sizeof(_u32_m) } },
    { "u16", { TYPES::E_U16, sizeof(_u16_m) } },
    { "u8", { TYPES::E_U8, sizeof(_u8_m) } },
    { "int", { TYPES::E_INT, sizeof(int) } },
    { "short", { TYPES::E_SHORT, sizeof(short) } },
    { "double", { TYPES::E_DOUBLE, sizeof(double) } },
    { "char", { TYPES::E_CHAR, sizeof(char) } },
};

static Field parse_field(const std::string& type) {
    Field field;

    std::string            t     = type;
    std::string::size_type left  = type.find("[");
    std::string::size_type right = type.find("]");

    if (left != std::string::npos && right != std::string::npos && right > left) {
        t = type.substr(0, left);

        std::string s = type.substr(left + 1, right - left - 1);

        try {
            field.count = std::stoul(s);
        } catch (const std::exception&) {
            throw std::invalid_argument("Not support type: " + type);
        }

        field.array = true;
    }

    auto found = type_map.find(t);

    if (found == type_map.end() || field.count == 0) {
        throw std::invalid_argument("Not support type: " + type);
    }

    field.type = found->second.first;
    field.size = found->second.second;

    return field;
}

KeyLayout::KeyLayout(const std::vector<Label>& labels) {
    size_t align = 1;

    for (auto it = labels.begin(); it != labels.end(); it++) {
        Field field = parse_field((*it).type);

        // 元素大小即对齐要求
        if (size % field.size) {
            size += field.size - size % field.size;
        }

        field.offset = size;
        size += field.size * field.count;
        align = std::max(align, field.size);

        fields.push_back(field);
    }

    if (size % align) {
        size += align - size % align;
    }
}

template <typename T>
static T load(const char* p) {
    T v;
    memcpy(&v, p, sizeof(T));
    return v;
}

static void render_scalar(std::ostringstream& oss, const char* p, TYPES t) {
    switch (t) {
    case TYPES::E_U64:
        oss << load<_u64_m>(p);
        break;
    case TYPES::E_U32:
        oss << load<_u32_m>(p);
        break;
    case TYPES::E_U16:
        oss << load<_u16_m>(p);
        break;
    case TYPES::E_U8:
        oss << static_cast<unsigned>(load<_u8_m>(p));
        break;
    case TYPES::E_INT:
        oss << load<int>(p);
        break;
    case TYPES::E_SHORT:
        oss << load<short>(p);
        break;
    case TYPES::E_DOUBLE:
        oss << load<double>(p);
        break;
    case TYPES::E_CHAR:
        oss << static_cast<int>(load<char>(p));
        break;
    }
}

// 空白会被当作字段分隔符, 连同反斜杠和不可打印字符一起写成 \xHH
static std::string escape(const std::string& in) {
    static const char* hex = "0123456789abcdef";

    std::string out;

    for (auto it = in.begin(); it != in.end(); it++) {
        unsigned char c = static_cast<unsigned char>(*it);

        if (c == '\\' || isspace(c) || !isprint(c)) {
            out += "\\x";
            out += hex[c >> 4];
            out += hex[c & 0xf];
        } else {
            out += *it;
        }
    }

    return out;
}

std::string KeyLayout::render(const void* key, size_t len) const {
    if (len < size) {
        throw std::invalid_argument("key has " + std::to_string(len) + " bytes, but layout needs " + std::to_string(size));
    }

    const char* p = static_cast<const char*>(key);

    std::ostringstream oss;

    oss << "{";

    for (auto it = fields.begin(); it != fields.end(); it++) {
        const Field& field = *it;

        oss << " ";

        if (field.array && field.type == TYPES::E_CHAR) {
            const char* s = p + field.offset;

            oss << "\"" << escape(std::string(s, strnlen(s, field.count))) << "\"";
            continue;
        }

        if (field.array) {
            oss << "[";
            for (size_t i = 0; i < field.count; i++) {
                if (i) oss << ",";
                render_scalar(oss, p + field.offset + i * field.size, field.type);
            }
            oss << "]";
            continue;
        }

        render_scalar(oss, p + field.offset, field.type);
    }

    oss << " }";

    return oss.str();
}
