#include <outliner-cpp/history.hpp>

#include <utility>

namespace outliner_cpp {

void History::record(Forest before) {
    past_.push_back(std::move(before));
    while (past_.size() > capacity_) past_.pop_front();
    future_.clear();
}

auto History::undo(const Forest& current) -> std::optional<Forest> {
    if (past_.empty()) return std::nullopt;

    auto previous = std::move(past_.back());
    past_.pop_back();

    future_.push_front(current);
    while (future_.size() > capacity_) future_.pop_back();
    return previous;
}

auto History::redo(const Forest& current) -> std::optional<Forest> {
    if (future_.empty()) return std::nullopt;

    auto next = std::move(future_.front());
    future_.pop_front();

    past_.push_back(current);
    while (past_.size() > capacity_) past_.pop_front();
    return next;
}

void History::clear() {
    past_.clear();
    future_.clear();
}

}  // namespace outliner_cpp
