#pragma once

#include <array>
#include <cstdint>
#include <cstddef>
#include <string>

namespace excelpic {
namespace utils {

/**
 * @brief SHA-256 摘要（FIPS 180-4），用于生成临时文件名
 */
class Sha256 {
public:
    using Digest = std::array<uint8_t, 32>;

    Sha256();

    void update(const void* data, size_t length);
    void update(const std::string& data) { update(data.data(), data.size()); }

    Digest finalize();

    /**
     * @brief 计算字符串的摘要并返回小写十六进制
     */
    static std::string hexDigest(const std::string& data);

private:
    void processBlock(const uint8_t* block);

    uint32_t h_[8];
    uint8_t buffer_[64];
    uint64_t bit_length_;
    size_t buffer_used_;
};

}} // namespace excelpic::utils
