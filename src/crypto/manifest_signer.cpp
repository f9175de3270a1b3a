#include "crypto/manifest_signer.hpp"

#include "crypto/base64.hpp"
#include "util/logger.hpp"

#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/rsa.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <vector>

namespace fs = std::filesystem;

namespace forge {

namespace {

struct BioDeleter {
    void operator()(BIO* b) const { BIO_free(b); }
};
using BioPtr = std::unique_ptr<BIO, BioDeleter>;

struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* c) const { EVP_MD_CTX_free(c); }
};
using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

std::string OpenSslError() {
    const unsigned long code = ERR_get_error();
    if (code == 0) return "unknown OpenSSL error";
    char buf[256]{};
    ERR_error_string_n(code, buf, sizeof(buf));
    ERR_clear_error();
    return buf;
}

bool ReadTextFile(const std::string& path, std::string& out) {
    std::ifstream is(path, std::ios::binary);
    if (!is.good()) return false;
    std::ostringstream ss;
    ss << is.rdbuf();
    out = ss.str();
    return true;
}

bool UsePkcs1Padding(EVP_PKEY_CTX* pctx, EVP_PKEY* key) {
    if (EVP_PKEY_get_base_id(key) != EVP_PKEY_RSA) return true;
    return EVP_PKEY_CTX_set_rsa_padding(pctx, RSA_PKCS1_PADDING) == 1;
}

std::string PublicPemOf(EVP_PKEY* key) {
    BioPtr bio(BIO_new(BIO_s_mem()));
    if (!bio || PEM_write_bio_PUBKEY(bio.get(), key) != 1) return {};
    char* data = nullptr;
    const long len = BIO_get_mem_data(bio.get(), &data);
    if (len <= 0 || !data) return {};
    return std::string(data, static_cast<size_t>(len));
}

} // namespace

Result ManifestSigner::FromPrivateKeyPem(const std::string& pem, ManifestSigner& out) {
    BioPtr bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
    if (!bio) return Result::Fail(ErrorCode::Internal, "BIO_new_mem_buf failed");

    EVP_PKEY* raw = PEM_read_bio_PrivateKey(bio.get(), nullptr, nullptr, nullptr);
    if (!raw) {
        return Result::Fail(ErrorCode::InvalidArgument, "invalid private key PEM: " + OpenSslError());
    }
    out.key_ = std::shared_ptr<EVP_PKEY>(raw, EVP_PKEY_free);
    if (out.public_pem_.empty()) {
        out.public_pem_ = PublicPemOf(raw);
    }
    return Result::Ok();
}

Result ManifestSigner::LoadFromFiles(const std::string& private_key_path,
                                     const std::string& public_key_path,
                                     ManifestSigner& out) {
    out = ManifestSigner{};

    std::error_code ec;
    if (!public_key_path.empty() && fs::exists(public_key_path, ec)) {
        if (!ReadTextFile(public_key_path, out.public_pem_)) {
            return Result::Fail(ErrorCode::Io, "cannot read public key: " + public_key_path);
        }
    }

    if (private_key_path.empty() || !fs::exists(private_key_path, ec)) {
        LogWarn("No signing key at '%s'; manifests will carry an empty signature",
                private_key_path.c_str());
        return Result::Ok();
    }

    std::string pem;
    if (!ReadTextFile(private_key_path, pem)) {
        return Result::Fail(ErrorCode::Io, "cannot read signing key: " + private_key_path);
    }
    auto r = FromPrivateKeyPem(pem, out);
    if (!r.is_ok()) {
        return Result::Fail(r.code, r.msg + " (" + private_key_path + ")");
    }
    LogInfo("Manifest signing key loaded from %s", private_key_path.c_str());
    return Result::Ok();
}

std::string ManifestSigner::Canonicalize(const Manifest& manifest) {
    // nlohmann::json objects are ordered maps, so dump() emits sorted keys.
    // Ill-formed UTF-8 becomes U+FFFD, which is also what a reader of the
    // stored manifest sees.
    return ManifestToJson(manifest, /*include_signature=*/false)
        .dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

Result ManifestSigner::Sign(const Manifest& manifest, std::string& out_signature_b64) const {
    out_signature_b64.clear();
    if (!key_) {
        return Result::Fail(ErrorCode::SigningUnavailable, "no signing key configured");
    }

    const std::string payload = Canonicalize(manifest);

    MdCtxPtr ctx(EVP_MD_CTX_new());
    if (!ctx) return Result::Fail(ErrorCode::Internal, "EVP_MD_CTX_new failed");

    EVP_PKEY_CTX* pctx = nullptr;
    if (EVP_DigestSignInit(ctx.get(), &pctx, EVP_sha256(), nullptr, key_.get()) != 1 ||
        !UsePkcs1Padding(pctx, key_.get())) {
        return Result::Fail(ErrorCode::Internal, "sign init failed: " + OpenSslError());
    }
    if (EVP_DigestSignUpdate(ctx.get(), payload.data(), payload.size()) != 1) {
        return Result::Fail(ErrorCode::Internal, "sign update failed: " + OpenSslError());
    }

    size_t sig_len = 0;
    if (EVP_DigestSignFinal(ctx.get(), nullptr, &sig_len) != 1) {
        return Result::Fail(ErrorCode::Internal, "sign size query failed: " + OpenSslError());
    }
    std::vector<std::uint8_t> sig(sig_len);
    if (EVP_DigestSignFinal(ctx.get(), sig.data(), &sig_len) != 1) {
        return Result::Fail(ErrorCode::Internal, "sign failed: " + OpenSslError());
    }
    sig.resize(sig_len);

    out_signature_b64 = Base64Encode(sig);
    return Result::Ok();
}

Result ManifestSigner::PublicKeyPem(std::string& out_pem) const {
    if (public_pem_.empty()) {
        return Result::Fail(ErrorCode::NotFound, "Public key not configured");
    }
    out_pem = public_pem_;
    return Result::Ok();
}

bool ManifestSigner::Verify(const Manifest& manifest,
                            const std::string& signature_b64,
                            const std::string& public_key_pem) {
    if (signature_b64.empty() || public_key_pem.empty()) return false;

    const auto sig = Base64Decode(signature_b64);
    if (!sig || sig->empty()) return false;

    BioPtr bio(BIO_new_mem_buf(public_key_pem.data(), static_cast<int>(public_key_pem.size())));
    if (!bio) return false;
    std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)> key(
        PEM_read_bio_PUBKEY(bio.get(), nullptr, nullptr, nullptr), EVP_PKEY_free);
    if (!key) {
        ERR_clear_error();
        return false;
    }

    const std::string payload = Canonicalize(manifest);
    MdCtxPtr ctx(EVP_MD_CTX_new());
    EVP_PKEY_CTX* pctx = nullptr;
    if (!ctx || EVP_DigestVerifyInit(ctx.get(), &pctx, EVP_sha256(), nullptr, key.get()) != 1 ||
        !UsePkcs1Padding(pctx, key.get())) {
        ERR_clear_error();
        return false;
    }
    const int rc = EVP_DigestVerify(ctx.get(),
                                    sig->data(),
                                    sig->size(),
                                    reinterpret_cast<const unsigned char*>(payload.data()),
                                    payload.size());
    ERR_clear_error();
    return rc == 1;
}

} // namespace forge
