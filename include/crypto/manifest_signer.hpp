#pragma once

#include "model/manifest.hpp"
#include "util/result.hpp"

#include <memory>
#include <string>

typedef struct evp_pkey_st EVP_PKEY;

namespace forge {

// RSA PKCS#1 v1.5 / SHA-256 signatures over the canonical manifest encoding.
//
// A signer without a private key is valid: Sign() then yields an empty
// signature and ErrorCode::SigningUnavailable, and the manifest stays usable
// but unverifiable.
class ManifestSigner {
public:
    ManifestSigner() = default;

    // A missing private key file leaves the signer unkeyed; an unreadable or
    // malformed one is an error. `public_key_path` may be empty.
    static Result LoadFromFiles(const std::string& private_key_path,
                                const std::string& public_key_path,
                                ManifestSigner& out);
    static Result FromPrivateKeyPem(const std::string& pem, ManifestSigner& out);

    bool HasSigningKey() const { return key_ != nullptr; }

    // Compact JSON, keys sorted, every field except "signature".
    static std::string Canonicalize(const Manifest& manifest);

    Result Sign(const Manifest& manifest, std::string& out_signature_b64) const;

    Result PublicKeyPem(std::string& out_pem) const;

    static bool Verify(const Manifest& manifest,
                       const std::string& signature_b64,
                       const std::string& public_key_pem);

private:
    std::shared_ptr<EVP_PKEY> key_;
    std::string public_pem_;
};

} // namespace forge
