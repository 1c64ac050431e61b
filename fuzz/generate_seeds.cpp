// Helper to generate seed corpus files for fuzz testing.
// Build and run once: ./generate_seeds
// Not a fuzz target itself, just a corpus generator.

#include <outliner-cpp/json.hpp>
#include <outliner-cpp/outliner.hpp>

#include <filesystem>
#include <fstream>
#include <string>

static void write_seed(const std::string& path, const std::string& data) {
    auto ofs = std::ofstream{path, std::ios::binary};
    ofs << data;
}

int main() {
    namespace fs = std::filesystem;
    namespace ol = outliner_cpp;
    const auto text_dir = std::string{"fuzz/corpus/outline"};
    const auto json_dir = std::string{"fuzz/corpus/json"};
    fs::create_directories(text_dir);
    fs::create_directories(json_dir);

    // Outline text seeds
    write_seed(text_dir + "/seed_empty.txt", "");
    write_seed(text_dir + "/seed_spaces.txt", "Root 1\n Child 1.1\n  Child 1.1.1\n Child 1.2\nRoot 2");
    write_seed(text_dir + "/seed_tabs.txt", "a\n\tb\n\t\tc\n\n\td\ne");
    write_seed(text_dir + "/seed_ragged.txt", "  a\n     b\n c\r\n\t d \n");

    // JSON seeds: the sample outline and an empty forest
    auto ids = ol::SequentialIdGenerator{};
    write_seed(json_dir + "/seed_sample.json", ol::export_json(ol::sample_forest(ids)).dump());
    write_seed(json_dir + "/seed_empty.json", ol::export_json(ol::Forest{}).dump());
    write_seed(json_dir + "/seed_invalid.json",
               R"([{"id":"a","text":"A","parentId":"a","order":0}])");

    return 0;
}
