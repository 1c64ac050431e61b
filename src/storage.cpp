#include <outliner-cpp/storage.hpp>
#include <outliner-cpp/json.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <fstream>
#include <system_error>

namespace outliner_cpp {

// -- MemoryStorage ------------------------------------------------------------

auto MemoryStorage::save(const Forest& forest) -> bool {
    saved_ = forest;
    ++save_count_;
    return true;
}

auto MemoryStorage::load() -> std::optional<Forest> {
    return saved_;
}

void MemoryStorage::clear() {
    saved_.reset();
}

// -- FileStorage --------------------------------------------------------------

auto FileStorage::save(const Forest& forest) -> bool {
    auto tmp = path_;
    tmp += ".tmp";
    {
        auto out = std::ofstream{tmp, std::ios::binary | std::ios::trunc};
        if (!out) {
            spdlog::error("FileStorage: cannot open '{}' for writing", tmp.string());
            return false;
        }
        // Labels are arbitrary bytes; invalid UTF-8 is written as U+FFFD.
        out << export_json(forest).dump(2, ' ', false, nlohmann::json::error_handler_t::replace)
            << '\n';
        if (!out) {
            spdlog::error("FileStorage: write to '{}' failed", tmp.string());
            return false;
        }
    }

    auto ec = std::error_code{};
    std::filesystem::rename(tmp, path_, ec);
    if (ec) {
        spdlog::error("FileStorage: cannot replace '{}': {}", path_.string(), ec.message());
        std::filesystem::remove(tmp, ec);
        return false;
    }
    return true;
}

auto FileStorage::load() -> std::optional<Forest> {
    auto ec = std::error_code{};
    if (!std::filesystem::exists(path_, ec)) return std::nullopt;

    auto in = std::ifstream{path_, std::ios::binary};
    if (!in) {
        spdlog::error("FileStorage: cannot open '{}' for reading", path_.string());
        return std::nullopt;
    }

    auto j = nlohmann::json::parse(in, nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded()) {
        spdlog::error("FileStorage: '{}' is not valid JSON", path_.string());
        return std::nullopt;
    }
    return import_json(j);
}

void FileStorage::clear() {
    auto ec = std::error_code{};
    if (!std::filesystem::remove(path_, ec) && ec) {
        spdlog::error("FileStorage: cannot remove '{}': {}", path_.string(), ec.message());
    }
}

}  // namespace outliner_cpp
