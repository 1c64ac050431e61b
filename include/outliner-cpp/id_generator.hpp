/// @file id_generator.hpp
/// @brief Sources of fresh NodeIds.

#pragma once

#include <outliner-cpp/types.hpp>

#include <cstdint>
#include <random>
#include <string>
#include <utility>

namespace outliner_cpp {

/// Produces a fresh, never-repeating NodeId per call.
///
/// The engine never invents ids itself: inserts and the outline parser draw
/// them from an IdGenerator owned by the caller.
class IdGenerator {
public:
    virtual ~IdGenerator() = default;

    /// Return an id that has not been returned before.
    virtual auto next() -> NodeId = 0;
};

/// Random RFC 4122 version-4 UUIDs, e.g. "3f2b8c1e-9d4a-4f6b-8a2e-1c5d7e9f0a3b".
class RandomIdGenerator final : public IdGenerator {
public:
    /// Seed from std::random_device.
    RandomIdGenerator();

    /// Seed explicitly (reproducible sequences for tests and fuzzing).
    explicit RandomIdGenerator(std::uint64_t seed);

    auto next() -> NodeId override;

private:
    std::mt19937_64 engine_;
};

/// Deterministic ids "<prefix>1", "<prefix>2", ...
/// Each instance starts counting at 1, so ids repeat across processes.
/// Meant for tests and reproducible runs; Store skips ids already in use.
class SequentialIdGenerator final : public IdGenerator {
public:
    explicit SequentialIdGenerator(std::string prefix = "n")
        : prefix_{std::move(prefix)} {}

    auto next() -> NodeId override;

    /// Number of ids handed out so far.
    auto issued() const -> std::uint64_t { return counter_; }

private:
    std::string prefix_;
    std::uint64_t counter_{0};
};

}  // namespace outliner_cpp
