// Fuzz target for import_json(): exercises JSON decoding and validate().
// Any imported forest is exported again and must re-import unchanged.

#include <outliner-cpp/json.hpp>
#include <outliner-cpp/tree_ops.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <cstdlib>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    namespace ol = outliner_cpp;
    const auto j = nlohmann::json::parse(data, data + size, nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded()) return 0;

    auto forest = ol::import_json(j);
    if (!forest) return 0;

    // A valid forest must be fully reachable from the sentinel.
    if (ol::get_flattened_order(*forest).size() != forest->visible_size()) std::abort();

    auto again = ol::import_json(ol::export_json(*forest));
    if (!again || !(*again == *forest)) std::abort();
    return 0;
}
