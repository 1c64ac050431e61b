/// @file history.hpp
/// @brief Bounded undo/redo history of Forest snapshots.

#pragma once

#include <outliner-cpp/forest.hpp>

#include <cstddef>
#include <deque>
#include <optional>

namespace outliner_cpp {

/// Two bounded stacks of snapshots: past (undo) and future (redo).
///
/// Only structural edits are recorded; the caller passes the snapshot that
/// was current *before* the edit to record(). When a stack exceeds its
/// capacity the oldest entry is evicted. Snapshots share storage, so a
/// full history costs one pointer per entry plus whatever nodes differ.
///
/// @code
/// auto history = History{};
/// auto next = indent_node(current, id);
/// if (next) {
///     history.record(current);
///     current = next.forest();
/// }
/// if (auto prev = history.undo(current)) current = *prev;
/// @endcode
class History {
public:
    /// Default number of retained snapshots per direction.
    static constexpr std::size_t default_capacity = 50;

    explicit History(std::size_t capacity = default_capacity) : capacity_{capacity} {}

    /// Record the pre-edit snapshot of a structural edit.
    /// Clears the redo stack: a new edit invalidates any redo path.
    void record(Forest before);

    /// Step back. Pushes `current` onto the redo stack.
    /// @return The snapshot to adopt, or nullopt when there is nothing to undo.
    auto undo(const Forest& current) -> std::optional<Forest>;

    /// Step forward. Pushes `current` onto the undo stack.
    /// @return The snapshot to adopt, or nullopt when there is nothing to redo.
    auto redo(const Forest& current) -> std::optional<Forest>;

    auto can_undo() const -> bool { return !past_.empty(); }
    auto can_redo() const -> bool { return !future_.empty(); }

    auto past_size() const -> std::size_t { return past_.size(); }
    auto future_size() const -> std::size_t { return future_.size(); }
    auto capacity() const -> std::size_t { return capacity_; }

    /// Drop both stacks.
    void clear();

private:
    std::size_t capacity_;
    std::deque<Forest> past_;    // back = most recent
    std::deque<Forest> future_;  // front = next to redo
};

}  // namespace outliner_cpp
