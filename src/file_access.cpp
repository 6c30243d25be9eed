#include "strata/file_access.hpp"

#include "strata/mmap.hpp"

#include <exception>

namespace strata {

LocalFileAccess::LocalFileAccess(std::filesystem::path base_dir) : base_dir_(std::move(base_dir)) {
}

Result<std::string> LocalFileAccess::read_input(std::string_view reference) {
    if (reference.empty()) {
        return make_error(ErrorCode::UnreadableInput, "empty file reference");
    }

    std::filesystem::path path{reference};
    if (path.is_relative()) {
        path = base_dir_ / path;
    }

    try {
        MappedFile file{path};
        return std::string(file.content());
    } catch (const std::exception &e) {
        return make_error(ErrorCode::UnreadableInput, "{}", e.what());
    }
}

} // namespace strata
