#pragma once

#include "strata/utility.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace strata {

/**
 * @brief Resolves file-reference inputs to their bytes.
 *
 * Shared by the Fingerprinter and stage runners.
 */
class FileAccess {
public:
    virtual ~FileAccess() = default;

    /**
     * @param reference The reference as written in the stage declaration.
     * @return The referenced bytes, or `UnreadableInput`.
     */
    virtual Result<std::string> read_input(std::string_view reference) = 0;
};

/** @brief Reads references as paths relative to a base directory. */
class LocalFileAccess final : public FileAccess {
public:
    explicit LocalFileAccess(std::filesystem::path base_dir = std::filesystem::current_path());

    Result<std::string> read_input(std::string_view reference) override;

private:
    std::filesystem::path base_dir_;
};

} // namespace strata
