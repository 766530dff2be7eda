#include "excelpic/utils/FileNameGenerator.hpp"
#include "excelpic/utils/Sha256.hpp"
#include <cstdint>
#include <random>
#include <fmt/format.h>

namespace excelpic {
namespace utils {

namespace {
    thread_local std::mt19937_64 rng{std::random_device{}()};
    thread_local std::uniform_int_distribution<uint64_t> dist;
}

std::string FileNameGenerator::randomUuid() {
    uint64_t high = dist(rng);
    uint64_t low = dist(rng);

    // 版本号 4，变体 10xx
    high = (high & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    low = (low & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    return fmt::format("{:08x}-{:04x}-{:04x}-{:04x}-{:012x}",
                       static_cast<uint32_t>(high >> 32),
                       static_cast<uint32_t>((high >> 16) & 0xFFFF),
                       static_cast<uint32_t>(high & 0xFFFF),
                       static_cast<uint32_t>(low >> 48),
                       low & 0xFFFFFFFFFFFFULL);
}

std::string FileNameGenerator::generateHashedFilename(const std::string& extension,
                                                      const std::optional<std::string>& modifier) {
    std::string hashed_id = Sha256::hexDigest(randomUuid());
    if (modifier) {
        return fmt::format("{}{}.{}", hashed_id, *modifier, extension);
    }
    return fmt::format("{}.{}", hashed_id, extension);
}

}} // namespace excelpic::utils
