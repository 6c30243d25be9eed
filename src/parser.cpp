#include "strata/parser.hpp"

#include "strata/mmap.hpp"

#include <nlohmann/json.hpp>
#include <string>

namespace strata {

namespace {

using json = nlohmann::json;

Result<InputDecl> parse_input(const json &j, std::string_view stage) {
    if (!j.is_object()) {
        return make_error(ErrorCode::InvalidSpec, "Stage '{}': input must be an object", stage);
    }
    auto kind_it = j.find("kind");
    if (kind_it == j.end() || !kind_it->is_string()) {
        return make_error(ErrorCode::InvalidSpec, "Stage '{}': input is missing a string 'kind'", stage);
    }
    const auto &kind = kind_it->get_ref<const std::string &>();

    InputDecl decl;
    if (kind == "command") {
        decl.kind = InputKind::CommandText;
    } else if (kind == "file") {
        decl.kind = InputKind::FileReference;
    } else if (kind == "parent") {
        decl.kind = InputKind::ParentArtifact;
        return decl;
    } else {
        return make_error(ErrorCode::InvalidSpec, "Stage '{}': unknown input kind '{}'", stage, kind);
    }

    auto value_it = j.find("value");
    if (value_it == j.end() || !value_it->is_string()) {
        return make_error(ErrorCode::InvalidSpec, "Stage '{}': '{}' input needs a string 'value'", stage, kind);
    }
    decl.value = value_it->get<std::string>();
    return decl;
}

Result<StageDecl> parse_stage(const json &j, size_t index) {
    if (!j.is_object()) {
        return make_error(ErrorCode::InvalidSpec, "Stage #{} must be an object", index);
    }

    StageDecl decl;
    auto name_it = j.find("name");
    if (name_it == j.end() || !name_it->is_string() || name_it->get_ref<const std::string &>().empty()) {
        return make_error(ErrorCode::InvalidSpec, "Stage #{} is missing a 'name'", index);
    }
    decl.name = name_it->get<std::string>();

    if (auto parent_it = j.find("parent"); parent_it != j.end() && !parent_it->is_null()) {
        if (!parent_it->is_string()) {
            return make_error(ErrorCode::InvalidSpec, "Stage '{}': 'parent' must be a string", decl.name);
        }
        decl.parent = parent_it->get<std::string>();
    }

    auto command_it = j.find("command");
    if (command_it == j.end()) {
        return make_error(ErrorCode::InvalidSpec, "Stage '{}' is missing a 'command'", decl.name);
    }
    if (command_it->is_string()) {
        decl.shell = true;
        decl.command.push_back(command_it->get<std::string>());
    } else if (command_it->is_array()) {
        decl.shell = false;
        for (const auto &arg : *command_it) {
            if (!arg.is_string()) {
                return make_error(ErrorCode::InvalidSpec, "Stage '{}': command arguments must be strings", decl.name);
            }
            decl.command.push_back(arg.get<std::string>());
        }
    } else {
        return make_error(
            ErrorCode::InvalidSpec, "Stage '{}': 'command' must be a string or an array of strings", decl.name);
    }
    if (decl.command.empty() || decl.command.front().empty()) {
        return make_error(ErrorCode::InvalidSpec, "Stage '{}' has an empty command", decl.name);
    }

    if (auto inputs_it = j.find("inputs"); inputs_it != j.end()) {
        if (!inputs_it->is_array()) {
            return make_error(ErrorCode::InvalidSpec, "Stage '{}': 'inputs' must be an array", decl.name);
        }
        for (const auto &input : *inputs_it) {
            auto res = parse_input(input, decl.name);
            if (!res)
                return std::unexpected(res.error());
            decl.inputs.push_back(std::move(*res));
        }
    }
    return decl;
}

} // namespace

Result<PipelineSpec> parse_spec(std::string_view json_text) {
    json doc = json::parse(json_text, nullptr, false);
    if (doc.is_discarded()) {
        return make_error(ErrorCode::InvalidSpec, "Malformed pipeline JSON");
    }

    auto stages_it = doc.is_object() ? doc.find("stages") : doc.end();
    if (!doc.is_object() || stages_it == doc.end() || !stages_it->is_array()) {
        return make_error(ErrorCode::InvalidSpec, "Pipeline must be an object with a 'stages' array");
    }

    PipelineSpec spec;
    spec.stages.reserve(stages_it->size());
    size_t index = 0;
    for (const auto &stage : *stages_it) {
        auto res = parse_stage(stage, index++);
        if (!res)
            return std::unexpected(res.error());
        spec.stages.push_back(std::move(*res));
    }
    return spec;
}

Result<PipelineSpec> load_spec(const std::filesystem::path &path) {
    try {
        MappedFile file{path};
        return parse_spec(file.content());
    } catch (const std::exception &err) {
        return make_error(ErrorCode::UnreadableInput, "{}", err.what());
    }
}

} // namespace strata
