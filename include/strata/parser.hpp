#pragma once

#include "strata/domain.hpp"
#include "strata/utility.hpp"

#include <filesystem>
#include <string_view>

namespace strata {

/**
 * @brief Parses a JSON pipeline description.
 *
 * @code
 * {"stages": [
 *   {"name": "deps", "command": "npm ci", "inputs": [{"kind": "file", "value": "package-lock.json"}]},
 *   {"name": "build", "parent": "deps", "command": ["make", "all"], "inputs": [{"kind": "parent"}]}
 * ]}
 * @endcode
 *
 * A string command runs through the shell, an array runs as an argument list.
 * Input kinds are `command`, `file` and `parent`.
 *
 * @return The spec, or `InvalidSpec`.
 */
Result<PipelineSpec> parse_spec(std::string_view json_text);

/**
 * @brief Reads and parses a pipeline file.
 * @return The spec, `UnreadableInput` if the file cannot be read, or `InvalidSpec`.
 */
Result<PipelineSpec> load_spec(const std::filesystem::path &path);

} // namespace strata
