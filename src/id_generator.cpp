#include <outliner-cpp/id_generator.hpp>

#include <array>
#include <cstddef>

namespace outliner_cpp {

namespace {

auto bytes_to_uuid(const std::array<unsigned char, 16>& bytes) -> std::string {
    static constexpr char hex_chars[] = "0123456789abcdef";
    auto result = std::string{};
    result.reserve(36);
    for (std::size_t i = 0; i < bytes.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) result.push_back('-');
        result.push_back(hex_chars[bytes[i] >> 4]);
        result.push_back(hex_chars[bytes[i] & 0x0F]);
    }
    return result;
}

}  // anonymous namespace

RandomIdGenerator::RandomIdGenerator()
    : engine_{[] {
          auto device = std::random_device{};
          return (static_cast<std::uint64_t>(device()) << 32) | device();
      }()} {}

RandomIdGenerator::RandomIdGenerator(std::uint64_t seed) : engine_{seed} {}

auto RandomIdGenerator::next() -> NodeId {
    auto bytes = std::array<unsigned char, 16>{};
    const auto hi = engine_();
    const auto lo = engine_();
    for (std::size_t i = 0; i < 8; ++i) {
        bytes[i] = static_cast<unsigned char>(hi >> (56 - 8 * i));
        bytes[i + 8] = static_cast<unsigned char>(lo >> (56 - 8 * i));
    }
    bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0F) | 0x40);  // version 4
    bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3F) | 0x80);  // RFC 4122 variant
    return NodeId{bytes_to_uuid(bytes)};
}

auto SequentialIdGenerator::next() -> NodeId {
    ++counter_;
    return NodeId{prefix_ + std::to_string(counter_)};
}

}  // namespace outliner_cpp
