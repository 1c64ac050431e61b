/// @file storage.hpp
/// @brief Persistence collaborators for Forest snapshots.

#pragma once

#include <outliner-cpp/forest.hpp>

#include <cstddef>
#include <filesystem>
#include <optional>
#include <utility>

namespace outliner_cpp {

/// Opaque save/load of the node collection.
///
/// The engine has no knowledge of the medium. Store calls save() after
/// every change to its snapshot and load() once at construction.
class Storage {
public:
    virtual ~Storage() = default;

    /// Persist a snapshot, replacing whatever was saved before.
    /// @return false if the snapshot could not be written.
    virtual auto save(const Forest& forest) -> bool = 0;

    /// The last saved snapshot, or nullopt if none exists or it is unreadable.
    virtual auto load() -> std::optional<Forest> = 0;

    /// Forget the saved snapshot.
    virtual void clear() = 0;
};

/// Keeps the last saved snapshot in memory. Used by default and in tests.
class MemoryStorage final : public Storage {
public:
    auto save(const Forest& forest) -> bool override;
    auto load() -> std::optional<Forest> override;
    void clear() override;

    /// Number of successful save() calls so far.
    auto save_count() const -> std::size_t { return save_count_; }

private:
    std::optional<Forest> saved_;
    std::size_t save_count_{0};
};

/// Saves the snapshot as a JSON file (see json.hpp for the format).
/// Invalid UTF-8 in node text is saved as U+FFFD.
///
/// Writes go to a sibling temporary file that is then renamed over the
/// target, so a crash mid-write never leaves a truncated file behind.
class FileStorage final : public Storage {
public:
    explicit FileStorage(std::filesystem::path path) : path_{std::move(path)} {}

    auto save(const Forest& forest) -> bool override;
    auto load() -> std::optional<Forest> override;
    void clear() override;

    auto path() const -> const std::filesystem::path& { return path_; }

private:
    std::filesystem::path path_;
};

}  // namespace outliner_cpp
