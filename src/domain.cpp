#include "strata/domain.hpp"

namespace strata {

std::string_view to_string(InputKind kind) {
    switch (kind) {
    case InputKind::CommandText:
        return "command";
    case InputKind::FileReference:
        return "file";
    case InputKind::ParentArtifact:
        return "parent";
    }
    return "unknown";
}

std::string_view to_string(Outcome outcome) {
    switch (outcome) {
    case Outcome::CacheHit:
        return "cache-hit";
    case Outcome::Built:
        return "built";
    case Outcome::Failed:
        return "failed";
    case Outcome::Planned:
        return "planned";
    }
    return "unknown";
}

std::string Fingerprint::to_hex() const {
    static constexpr char HEX[] = "0123456789abcdef";
    std::string out;
    out.reserve(SIZE * 2);
    for (uint8_t b : bytes) {
        out.push_back(HEX[b >> 4]);
        out.push_back(HEX[b & 0x0F]);
    }
    return out;
}

std::optional<Fingerprint> Fingerprint::from_hex(std::string_view hex) {
    if (hex.size() != SIZE * 2)
        return std::nullopt;

    auto nibble = [](char c) -> int {
        if (c >= '0' && c <= '9')
            return c - '0';
        if (c >= 'a' && c <= 'f')
            return c - 'a' + 10;
        return -1;
    };

    Fingerprint fp;
    for (size_t i = 0; i < SIZE; ++i) {
        int hi = nibble(hex[2 * i]);
        int lo = nibble(hex[2 * i + 1]);
        if (hi < 0 || lo < 0)
            return std::nullopt;
        fp.bytes[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return fp;
}

} // namespace strata
