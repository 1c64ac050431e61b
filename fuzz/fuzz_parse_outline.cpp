// Fuzz target for parse_outline(): any byte string is accepted outline text.
// The result must validate, and format -> parse -> format must be stable.

#include <outliner-cpp/outline_text.hpp>

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <string_view>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    namespace ol = outliner_cpp;
    const auto text = std::string_view{reinterpret_cast<const char*>(data), size};

    auto ids = ol::SequentialIdGenerator{};
    const auto forest = ol::parse_outline(text, ids);
    if (ol::validate(forest)) std::abort();

    const auto once = ol::format_outline(forest);
    auto again_ids = ol::SequentialIdGenerator{};
    const auto twice = ol::format_outline(ol::parse_outline(once, again_ids));
    if (once != twice) std::abort();
    return 0;
}
