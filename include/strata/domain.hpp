#pragma once

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace strata {

enum class InputKind : uint8_t {
    CommandText = 1,
    FileReference = 2,
    ParentArtifact = 3,
};

std::string_view to_string(InputKind kind);

struct InputDecl {
    InputKind kind;
    std::string value; // literal text, or a file reference; unused for ParentArtifact
};

/**
 * @brief A stage as declared in a pipeline spec.
 *
 * `command` holds either a single shell string (one element) or an argument
 * list, as flagged by `shell`.
 */
struct StageDecl {
    std::string name;
    std::optional<std::string> parent;
    std::vector<std::string> command;
    bool shell = true;
    std::vector<InputDecl> inputs;
};

struct PipelineSpec {
    std::vector<StageDecl> stages;
};

/** @brief SHA-256 digest identifying a stage's inputs. */
struct Fingerprint {
    static constexpr size_t SIZE = 32;

    std::array<uint8_t, SIZE> bytes{};

    std::string to_hex() const;
    static std::optional<Fingerprint> from_hex(std::string_view hex);

    bool operator==(const Fingerprint &) const = default;
    auto operator<=>(const Fingerprint &) const = default;
};

struct Artifact {
    std::string payload;
    std::chrono::system_clock::time_point created = std::chrono::system_clock::now();
    std::string stage;

    size_t size() const {
        return payload.size();
    }
};

enum class Outcome : uint8_t {
    CacheHit,
    Built,
    Failed,
    Planned, // dry run only: would be built
};

std::string_view to_string(Outcome outcome);

struct BuildResult {
    std::string stage;
    std::optional<Fingerprint> fingerprint; // absent when fingerprinting itself failed
    Outcome outcome;
    std::chrono::nanoseconds duration{0};
    std::string error;
};

} // namespace strata

template <>
struct std::hash<strata::Fingerprint> {
    size_t operator()(const strata::Fingerprint &fp) const noexcept {
        size_t h = 0;
        for (size_t i = 0; i < sizeof(size_t); ++i) {
            h = (h << 8) | fp.bytes[i];
        }
        return h;
    }
};
