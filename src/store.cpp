#include <outliner-cpp/store.hpp>

#include <outliner-cpp/outline_text.hpp>

#include <spdlog/spdlog.h>

#include <utility>
#include <vector>

namespace outliner_cpp {

auto sample_forest(IdGenerator& ids) -> Forest {
    const auto r1 = ids.next();
    const auto c11 = ids.next();
    const auto c111 = ids.next();
    const auto c12 = ids.next();
    const auto r2 = ids.next();
    const auto c21 = ids.next();
    const auto c22 = ids.next();

    return Forest{std::vector<Node>{
        make_root_node(),
        Node{.id = r1,   .text = "Root 1",      .parent_id = forest_root_id, .order = 0},
        Node{.id = c11,  .text = "Child 1.1",   .parent_id = r1,             .order = 0},
        Node{.id = c111, .text = "Child 1.1.1", .parent_id = c11,            .order = 0},
        Node{.id = c12,  .text = "Child 1.2",   .parent_id = r1,             .order = 1},
        Node{.id = r2,   .text = "Root 2",      .parent_id = forest_root_id, .order = 1},
        Node{.id = c21,  .text = "Child 2.1",   .parent_id = r2,             .order = 0},
        Node{.id = c22,  .text = "Child 2.2",   .parent_id = r2,             .order = 1},
    }};
}

Store::Store() : Store{StoreConfig{}, nullptr, nullptr} {}

Store::Store(StoreConfig config, std::shared_ptr<Storage> storage,
             std::shared_ptr<IdGenerator> ids)
    : config_{config},
      storage_{storage ? std::move(storage) : std::make_shared<MemoryStorage>()},
      ids_{ids ? std::move(ids) : std::make_shared<RandomIdGenerator>()},
      history_{config.history_capacity},
      forest_{initial_forest()} {}

auto Store::initial_forest() -> Forest {
    if (auto saved = storage_->load()) {
        if (auto err = validate(*saved)) {
            spdlog::warn("Store: discarding saved outline: {}", err->message);
        } else {
            spdlog::info("Store: loaded {} nodes", saved->visible_size());
            return std::move(*saved);
        }
    }
    if (config_.seed_sample_data) return sample_forest(*ids_);
    return Forest{};
}

// -- Selection ----------------------------------------------------------------

void Store::select(std::optional<NodeId> id) {
    selected_ = std::move(id);
}

auto Store::select_previous() -> bool {
    if (!selected_) return false;
    auto prev = previous_in_order(forest_, *selected_);
    if (!prev) return false;
    selected_ = std::move(prev);
    return true;
}

auto Store::select_next() -> bool {
    if (!selected_) return false;
    auto next = next_in_order(forest_, *selected_);
    if (!next) return false;
    selected_ = std::move(next);
    return true;
}

// -- Label edits --------------------------------------------------------------

auto Store::update_text(const NodeId& id, std::string text) -> bool {
    auto result = update_node_text(forest_, id, std::move(text));
    if (!result) return reject(result.error(), "update_text");
    adopt(std::move(result).forest());
    return true;
}

// -- Structural edits ---------------------------------------------------------

auto Store::indent(const NodeId& id) -> bool {
    return structural(indent_node(forest_, id), "indent");
}

auto Store::outdent(const NodeId& id) -> bool {
    return structural(outdent_node(forest_, id), "outdent");
}

auto Store::add_after(const NodeId& after_id) -> std::optional<NodeId> {
    auto id = fresh_id();
    // Used only when `after_id` is missing: append after the top-level nodes.
    const auto top_level = get_children(forest_, forest_root_id).size();
    auto node = Node{
        .id = id,
        .text = {},
        .parent_id = forest_root_id,
        .order = static_cast<double>(top_level),
    };
    if (!structural(add_node_after(forest_, after_id, std::move(node)), "add_after")) {
        return std::nullopt;
    }
    selected_ = id;
    return id;
}

auto Store::add_child(const NodeId& parent_id) -> std::optional<NodeId> {
    auto id = fresh_id();
    auto node = Node{.id = id, .text = {}, .parent_id = parent_id, .order = 0};
    if (!structural(outliner_cpp::add_child(forest_, parent_id, std::move(node)), "add_child")) {
        return std::nullopt;
    }
    selected_ = id;
    return id;
}

auto Store::remove(const NodeId& id) -> bool {
    const auto was_selected = selected_ == id;
    auto fallback = std::optional<NodeId>{};
    if (was_selected) {
        fallback = previous_in_order(forest_, id);
        if (!fallback) fallback = next_in_order(forest_, id);
    }
    if (!structural(delete_node(forest_, id), "remove")) return false;
    if (was_selected) selected_ = std::move(fallback);
    return true;
}

auto Store::move(const NodeId& id, const NodeId& new_parent_id,
                 std::optional<double> insert_order) -> bool {
    return structural(move_node(forest_, id, new_parent_id, insert_order), "move");
}

auto Store::move_before(const NodeId& id, const NodeId& target_id) -> bool {
    return structural(move_node_before(forest_, id, target_id), "move_before");
}

auto Store::move_after(const NodeId& id, const NodeId& target_id) -> bool {
    return structural(move_node_after(forest_, id, target_id), "move_after");
}

auto Store::move_as_first_child(const NodeId& id, const NodeId& target_id) -> bool {
    return structural(move_node_as_first_child(forest_, id, target_id), "move_as_first_child");
}

auto Store::drop(const NodeId& dragged_id, const std::optional<DropTarget>& target) -> bool {
    return structural(apply_drop(forest_, dragged_id, target), "drop");
}

// -- History ------------------------------------------------------------------

auto Store::undo() -> bool {
    auto previous = history_.undo(forest_);
    if (!previous) return reject(Error{ErrorKind::no_op, "nothing to undo"}, "undo");
    adopt(std::move(*previous));
    return true;
}

auto Store::redo() -> bool {
    auto next = history_.redo(forest_);
    if (!next) return reject(Error{ErrorKind::no_op, "nothing to redo"}, "redo");
    adopt(std::move(*next));
    return true;
}

// -- Whole-snapshot operations ------------------------------------------------

auto Store::set_forest(Forest forest) -> bool {
    if (auto err = validate(forest)) return reject(*err, "set_forest");
    adopt(std::move(forest));
    return true;
}

void Store::import_text(std::string_view text) {
    auto forest = parse_outline(text, *ids_);
    spdlog::info("Store: imported {} nodes from outline text", forest.visible_size());
    storage_->clear();
    selected_.reset();
    adopt(std::move(forest));
}

auto Store::export_text() const -> std::string {
    return format_outline(forest_);
}

// -- Change notification ------------------------------------------------------

auto Store::subscribe(Listener listener) -> ListenerToken {
    const auto token = next_token_++;
    listeners_.emplace(token, std::move(listener));
    return token;
}

void Store::unsubscribe(ListenerToken token) {
    listeners_.erase(token);
}

// -- Internals ----------------------------------------------------------------

// A generator may hand out ids the loaded outline already uses.
auto Store::fresh_id() -> NodeId {
    auto id = ids_->next();
    while (forest_.contains(id)) id = ids_->next();
    return id;
}

auto Store::structural(EditResult result, std::string_view what) -> bool {
    if (!result) return reject(result.error(), what);
    history_.record(forest_);
    adopt(std::move(result).forest());
    spdlog::debug("Store: {} applied ({} nodes, {} undo steps)", what, forest_.visible_size(),
                  history_.past_size());
    return true;
}

auto Store::reject(const Error& error, std::string_view what) -> bool {
    spdlog::debug("Store: {} rejected ({}): {}", what, to_string_view(error.kind), error.message);
    last_error_ = error;
    return false;
}

void Store::adopt(Forest next) {
    const auto changed = !(next == forest_);
    forest_ = std::move(next);
    last_error_.reset();
    if (selected_ && !forest_.contains(*selected_)) selected_.reset();
    if (!changed) return;

    if (config_.autosave && !storage_->save(forest_)) {
        last_error_ = Error{ErrorKind::storage_error, "autosave failed"};
    }

    // Copy first: a listener may unsubscribe itself.
    const auto listeners = listeners_;
    for (const auto& [_, listener] : listeners) {
        listener(forest_);
    }
}

}  // namespace outliner_cpp
