#include <ens_mcp/ens/keccak.hpp>

#include <openssl/err.h>
#include <openssl/evp.h>

#include <memory>
#include <string>

namespace ens_mcp {

namespace {

struct EvpMdDeleter {
    void operator()(EVP_MD* md) const { EVP_MD_free(md); }
};

// Fetched once; EVP_MD objects are immutable and safe to share.
const EVP_MD* KeccakDigest() {
    static const std::unique_ptr<EVP_MD, EvpMdDeleter> md(
        EVP_MD_fetch(nullptr, "KECCAK-256", nullptr));
    if (!md) {
        ERR_clear_error();
    }
    return md.get();
}

Error MakeDigestError(const std::string& message) {
    return Error{"Keccak256", "", message, ErrorCategory::Internal, std::nullopt};
}

} // anonymous namespace

Result<Hash256, Error> Keccak256(std::string_view data) {
    const EVP_MD* md = KeccakDigest();
    if (md == nullptr) {
        return Result<Hash256, Error>::Err(MakeDigestError(
            "KECCAK-256 digest not available in the linked OpenSSL "
            "(requires OpenSSL 3.2 or newer)"));
    }

    Hash256 out{};
    unsigned int out_len = 0;
    if (EVP_Digest(data.data(), data.size(), out.data(), &out_len, md,
                   nullptr) != 1 ||
        out_len != out.size()) {
        ERR_clear_error();
        return Result<Hash256, Error>::Err(MakeDigestError("EVP_Digest failed"));
    }
    return Result<Hash256, Error>::Ok(out);
}

bool Keccak256Available() {
    return KeccakDigest() != nullptr;
}

} // namespace ens_mcp
