/// @file store.hpp
/// @brief Store -- the caller-owned state handle shared by both views.

#pragma once

#include <outliner-cpp/drop_target.hpp>
#include <outliner-cpp/error.hpp>
#include <outliner-cpp/forest.hpp>
#include <outliner-cpp/history.hpp>
#include <outliner-cpp/id_generator.hpp>
#include <outliner-cpp/storage.hpp>
#include <outliner-cpp/tree_ops.hpp>
#include <outliner-cpp/types.hpp>

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace outliner_cpp {

/// Construction-time settings of a Store.
struct StoreConfig {
    /// Snapshots retained per history direction.
    std::size_t history_capacity = History::default_capacity;
    /// Save through the Storage after every snapshot change.
    bool autosave = true;
    /// Start from sample data when the storage holds no usable snapshot.
    bool seed_sample_data = true;
};

/// The sample outline shown on first start: two top-level trees with
/// nested children ("Root 1" / "Root 2").
auto sample_forest(IdGenerator& ids) -> Forest;

/// Owns the current snapshot, the selection, and the undo history.
///
/// Store is the one place where state changes: the text outline and the
/// node diagram both hold a reference to the same Store and subscribe to
/// its changes. Every mutator delegates to a pure function in tree_ops.hpp;
/// structural edits that succeed are recorded in History, label
/// edits are not. Mutators return false when the edit was rejected, with the
/// reason in last_error().
///
/// Not internally synchronized; use it from one thread.
///
/// @code
/// auto store = Store{};
/// store.import_text("a\n b\nc");
/// auto c = get_flattened_order(store.forest()).back().id;
/// store.indent(c);          // c becomes a's second child
/// store.undo();
/// @endcode
class Store {
public:
    using Listener = std::function<void(const Forest&)>;
    using ListenerToken = std::size_t;

    /// In-memory storage and random ids.
    Store();

    /// @param config Settings; see StoreConfig.
    /// @param storage Persistence collaborator; nullptr means MemoryStorage.
    /// @param ids Id source; nullptr means RandomIdGenerator.
    Store(StoreConfig config, std::shared_ptr<Storage> storage,
          std::shared_ptr<IdGenerator> ids);

    Store(const Store&) = delete;
    auto operator=(const Store&) -> Store& = delete;
    Store(Store&&) = default;
    auto operator=(Store&&) -> Store& = default;

    // -- Reading --------------------------------------------------------------

    auto forest() const -> const Forest& { return forest_; }
    auto selected() const -> const std::optional<NodeId>& { return selected_; }
    auto history() const -> const History& { return history_; }

    /// Why the most recent mutator returned false (cleared on success).
    auto last_error() const -> const std::optional<Error>& { return last_error_; }

    // -- Selection ------------------------------------------------------------

    void select(std::optional<NodeId> id);

    /// Move the selection one node up in display order.
    auto select_previous() -> bool;

    /// Move the selection one node down in display order.
    auto select_next() -> bool;

    // -- Label edits (not recorded) -------------------------------------------

    auto update_text(const NodeId& id, std::string text) -> bool;

    // -- Structural edits (recorded) ------------------------------------------

    auto indent(const NodeId& id) -> bool;
    auto outdent(const NodeId& id) -> bool;

    /// Insert an empty node right after `after_id` and select it.
    /// When `after_id` does not exist the node is appended at the top level.
    /// @return The new node's id, or nullopt if the insert was rejected.
    auto add_after(const NodeId& after_id) -> std::optional<NodeId>;

    /// Append an empty last child of `parent_id` and select it.
    auto add_child(const NodeId& parent_id) -> std::optional<NodeId>;

    /// Delete a node, promoting its children. If it was selected, the
    /// selection moves to the previous node in display order, else the next.
    auto remove(const NodeId& id) -> bool;

    auto move(const NodeId& id, const NodeId& new_parent_id,
              std::optional<double> insert_order = std::nullopt) -> bool;
    auto move_before(const NodeId& id, const NodeId& target_id) -> bool;
    auto move_after(const NodeId& id, const NodeId& target_id) -> bool;
    auto move_as_first_child(const NodeId& id, const NodeId& target_id) -> bool;

    /// Apply a drag gesture resolved by resolve_drop_target().
    auto drop(const NodeId& dragged_id, const std::optional<DropTarget>& target) -> bool;

    // -- History --------------------------------------------------------------

    auto undo() -> bool;
    auto redo() -> bool;
    auto can_undo() const -> bool { return history_.can_undo(); }
    auto can_redo() const -> bool { return history_.can_redo(); }

    // -- Whole-snapshot operations --------------------------------------------

    /// Replace the snapshot without recording history. Rejected (returns
    /// false, last_error() = invalid_forest) if the forest fails validate().
    auto set_forest(Forest forest) -> bool;

    /// Replace the snapshot with parsed outline text. Clears the saved
    /// state and the selection; not recorded in history.
    void import_text(std::string_view text);

    /// The current snapshot as outline text.
    auto export_text() const -> std::string;

    // -- Change notification --------------------------------------------------

    /// Register a callback invoked with the new snapshot after every change.
    auto subscribe(Listener listener) -> ListenerToken;
    void unsubscribe(ListenerToken token);

private:
    auto initial_forest() -> Forest;
    auto fresh_id() -> NodeId;
    auto structural(EditResult result, std::string_view what) -> bool;
    auto reject(const Error& error, std::string_view what) -> bool;
    void adopt(Forest next);

    StoreConfig config_;
    std::shared_ptr<Storage> storage_;
    std::shared_ptr<IdGenerator> ids_;
    History history_;
    Forest forest_;
    std::optional<NodeId> selected_;
    std::optional<Error> last_error_;
    std::map<ListenerToken, Listener> listeners_;
    ListenerToken next_token_{0};
};

}  // namespace outliner_cpp
