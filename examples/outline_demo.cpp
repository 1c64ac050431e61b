// outline_demo - text import, structural edits, undo/redo and export
//
// Demonstrates: Store, import_text, indent/outdent, add_after, remove,
//               undo/redo, listeners, FileStorage autosave
//
// Build: cmake --build build
// Run:   ./build/examples/outline_demo [--verbose]

#include <outliner-cpp/outliner.hpp>

#include <spdlog/spdlog.h>

#include <cstdio>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

namespace ol = outliner_cpp;

static void print(std::string_view title, const ol::Store& store) {
    std::printf("-- %.*s --\n", static_cast<int>(title.size()), title.data());
    if (const auto& err = store.last_error()) {
        const auto kind = ol::to_string_view(err->kind);
        std::printf("(rejected: %.*s, %s)\n", static_cast<int>(kind.size()), kind.data(),
                    err->message.c_str());
    }
    std::printf("%s\n\n", store.export_text().c_str());
}

static auto find_by_text(const ol::Store& store, std::string_view text) -> ol::NodeId {
    for (const auto& node : ol::get_flattened_order(store.forest())) {
        if (node.text == text) return node.id;
    }
    return ol::NodeId{};
}

int main(int argc, char** argv) {
    if (argc > 1 && std::string_view{argv[1]} == "--verbose") {
        spdlog::set_level(spdlog::level::debug);
    }

    const auto path = std::filesystem::temp_directory_path() / "outline_demo.json";
    auto storage = std::make_shared<ol::FileStorage>(path);
    auto store = ol::Store{ol::StoreConfig{.history_capacity = 20}, storage,
                           std::make_shared<ol::SequentialIdGenerator>()};

    auto changes = 0;
    store.subscribe([&](const ol::Forest&) { ++changes; });

    store.import_text(
        "Groceries\n"
        "\tFruit\n"
        "\t\tApples\n"
        "\t\tPears\n"
        "\tBread\n"
        "Chores\n"
        "\tLaundry");
    print("imported (tabs become single spaces)", store);

    // -- Structural edits -----------------------------------------------------
    store.indent(find_by_text(store, "Bread"));
    print("indent Bread under Fruit", store);

    store.outdent(find_by_text(store, "Pears"));
    print("outdent Pears", store);

    if (auto added = store.add_after(find_by_text(store, "Laundry"))) {
        store.update_text(*added, "Dishes");
    }
    print("add Dishes after Laundry", store);

    store.remove(find_by_text(store, "Fruit"));
    print("remove Fruit (children are promoted)", store);

    // -- Rejected edits -------------------------------------------------------
    store.outdent(find_by_text(store, "Chores"));
    print("outdent Chores (already top-level)", store);

    // -- Undo / redo ----------------------------------------------------------
    while (store.can_undo()) store.undo();
    print("after undoing everything", store);

    store.redo();
    print("redo once", store);

    std::printf("listener saw %d changes; saved to %s\n", changes, path.string().c_str());

    storage->clear();
    return 0;
}
