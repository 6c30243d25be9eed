#include "strata/fingerprint.hpp"

#include <cstdint>
#include <memory>
#include <stdexcept>

#include <openssl/evp.h>

namespace strata {

namespace {

constexpr std::string_view FINGERPRINT_TAG{"strata-fingerprint-v1\0", 22};
constexpr uint8_t ROOT_MARKER = 0x00;
constexpr uint8_t PARENT_MARKER = 0x01;

struct MdCtxDeleter {
    void operator()(EVP_MD_CTX *ctx) const {
        EVP_MD_CTX_free(ctx);
    }
};

class Sha256 {
public:
    static Result<Sha256> create() {
        std::unique_ptr<EVP_MD_CTX, MdCtxDeleter> ctx(EVP_MD_CTX_new());
        if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
            return make_error(ErrorCode::DigestFailure, "EVP_DigestInit_ex(sha256) failed");
        }
        return Sha256(std::move(ctx));
    }

    void update(std::string_view bytes) {
        if (!bytes.empty())
            EVP_DigestUpdate(ctx_.get(), bytes.data(), bytes.size());
    }

    void update_byte(uint8_t b) {
        EVP_DigestUpdate(ctx_.get(), &b, 1);
    }

    // Little-endian so the encoding does not depend on the host.
    void update_u64(uint64_t v) {
        uint8_t buf[8];
        for (int i = 0; i < 8; ++i) {
            buf[i] = static_cast<uint8_t>(v >> (8 * i));
        }
        EVP_DigestUpdate(ctx_.get(), buf, sizeof(buf));
    }

    void update_field(std::string_view bytes) {
        update_u64(bytes.size());
        update(bytes);
    }

    void update_fingerprint(const Fingerprint &fp) {
        EVP_DigestUpdate(ctx_.get(), fp.bytes.data(), fp.bytes.size());
    }

    Fingerprint finish() {
        Fingerprint fp;
        unsigned int len = 0;
        EVP_DigestFinal_ex(ctx_.get(), fp.bytes.data(), &len);
        return fp;
    }

private:
    explicit Sha256(std::unique_ptr<EVP_MD_CTX, MdCtxDeleter> ctx) : ctx_(std::move(ctx)) {
    }

    std::unique_ptr<EVP_MD_CTX, MdCtxDeleter> ctx_;
};

Result<Fingerprint> try_digest(std::string_view bytes) {
    auto sha = Sha256::create();
    if (!sha)
        return std::unexpected(sha.error());
    sha->update(bytes);
    return sha->finish();
}

} // namespace

Fingerprint digest(std::string_view bytes) {
    auto fp = try_digest(bytes);
    if (!fp)
        throw std::runtime_error(fp.error().describe());
    return *fp;
}

Result<Fingerprint> Fingerprinter::fingerprint(const Stage &stage,
                                               const std::optional<Fingerprint> &parent,
                                               const Artifact *parent_artifact) const {
    auto created = Sha256::create();
    if (!created)
        return std::unexpected(created.error());
    Sha256 &sha = *created;
    sha.update(FINGERPRINT_TAG);

    if (parent) {
        sha.update_byte(PARENT_MARKER);
        sha.update_fingerprint(*parent);
    } else {
        sha.update_byte(ROOT_MARKER);
        sha.update_fingerprint(Fingerprint{});
    }

    sha.update_byte(stage.shell ? 1 : 0);
    sha.update_u64(stage.command.size());
    for (const auto &arg : stage.command) {
        sha.update_field(arg);
    }

    sha.update_u64(stage.inputs.size());
    for (const auto &input : stage.inputs) {
        sha.update_byte(static_cast<uint8_t>(input.kind));
        switch (input.kind) {
        case InputKind::CommandText:
            sha.update_field(input.value);
            break;
        case InputKind::FileReference: {
            auto content = files_.read_input(input.value);
            if (!content) {
                return make_error(ErrorCode::UnreadableInput,
                                  "stage '{}': cannot read '{}': {}",
                                  stage.name,
                                  input.value,
                                  content.error().message);
            }
            sha.update_field(input.value);
            sha.update_field(*content);
            break;
        }
        case InputKind::ParentArtifact: {
            if (!stage.parent || !parent_artifact) {
                return make_error(ErrorCode::UnreadableInput,
                                  "stage '{}': parent artifact input has no parent artifact",
                                  stage.name);
            }
            auto payload_digest = try_digest(parent_artifact->payload);
            if (!payload_digest)
                return std::unexpected(payload_digest.error());
            sha.update_fingerprint(*payload_digest);
            break;
        }
        }
    }

    return sha.finish();
}

} // namespace strata
