#ifndef _DECODER_H
#define _DECODER_H

#include "../exporter/label.hpp"

#include <regex>
#include <unordered_map>

class DecoderError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

class Decoder {
  public:
    virtual ~Decoder() = default;

    // 返回 std::nullopt 表示丢弃整行
    virtual std::optional<std::string> decode(const std::string& in, const Decoding& conf) = 0;
};

// 数字统一转为十进制
class UintDecoder : public Decoder {
  public:
    std::optional<std::string> decode(const std::string&, const Decoding&) override;
};

// 去掉字符串两侧的引号并还原 \xHH 转义
class StringDecoder : public Decoder {
  public:
    std::optional<std::string> decode(const std::string&, const Decoding&) override;
};

// 根据键获取值
class StaticMapDecoder : public Decoder {
  public:
    std::optional<std::string> decode(const std::string&, const Decoding&) override;
};

// 只保留匹配任一正则的值, 每个正则只编译一次
class RegexpDecoder : public Decoder {
  public:
    std::optional<std::string> decode(const std::string&, const Decoding&) override;

    // 已编译的正则数量
    size_t compiled() const;

  private:
    mutable std::mutex                 mutex;
    std::map<std::string, std::regex> cache;

    const std::regex& compile(const std::string& pattern);
};

// 数字 IP 转字符串
class InetDecoder : public Decoder {
  public:
    std::optional<std::string> decode(const std::string&, const Decoding&) override;

    static std::string inet(int, const void*);
};

// 设备号转 major:minor
class MajorMinorDecoder : public Decoder {
  public:
    std::optional<std::string> decode(const std::string&, const Decoding&) override;
};

// 内核地址转符号名
class KsymDecoder : public Decoder {
  public:
    explicit KsymDecoder(std::string path = "/proc/kallsyms");

    std::optional<std::string> decode(const std::string&, const Decoding&) override;

  private:
    std::string path;

    std::mutex              mutex;
    bool                    loaded = false;
    std::map<_u64_m, std::string> symbols; // 起始地址 -> 符号

    void load();
};

class DecoderSet {
  public:
    DecoderSet();

    // 替换或新增一个解码器
    void add(const std::string& name, std::unique_ptr<Decoder> decoder);

    // 依次执行标签上的全部解码器, 失败抛出 DecoderError
    std::optional<std::string> decode(const std::string& in, const Label& label) const;

  private:
    std::unordered_map<std::string, std::unique_ptr<Decoder>> decoders;
};

#endif
