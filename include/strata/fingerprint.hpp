#pragma once

#include "strata/domain.hpp"
#include "strata/file_access.hpp"
#include "strata/stage_graph.hpp"
#include "strata/utility.hpp"

#include <optional>
#include <string_view>

namespace strata {

/** @brief SHA-256 of an arbitrary byte string. Throws std::runtime_error if OpenSSL cannot hash. */
Fingerprint digest(std::string_view bytes);

/**
 * @brief Computes cache keys for stages.
 *
 * The key covers the stage command, every declared input in declaration order,
 * and the parent's fingerprint (a fixed sentinel for root stages). The stage
 * name is not part of the key: two stages with identical commands, inputs and
 * ancestry share their cache entry.
 */
class Fingerprinter {
public:
    explicit Fingerprinter(FileAccess &files) : files_(files) {
    }

    /**
     * @param stage The stage to fingerprint.
     * @param parent The parent's resolved fingerprint, or nullopt for a root stage.
     * @param parent_artifact The parent's artifact, required when the stage declares a
     *        parent-artifact input.
     * @return The fingerprint, `UnreadableInput` if an input cannot be resolved, or
     *         `DigestFailure` if OpenSSL cannot hash. Never throws.
     */
    Result<Fingerprint> fingerprint(const Stage &stage,
                                    const std::optional<Fingerprint> &parent,
                                    const Artifact *parent_artifact = nullptr) const;

private:
    FileAccess &files_;
};

} // namespace strata
