#include "crypto/ed25519_signer.h"
#include "logging.h"

#include <memory>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <stdexcept>

namespace {

using PkeyPtr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
using PkeyCtxPtr = std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)>;
using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

std::string opensslError(const char* what) {
    char buf[256] = {0};
    unsigned long code = ERR_get_error();
    if (code != 0)
        ERR_error_string_n(code, buf, sizeof(buf));
    return std::string(what) + (code ? std::string(": ") + buf : std::string());
}

} // namespace

KeyPair Ed25519Signer::generateKeyPair() {
    PkeyCtxPtr ctx(EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr), EVP_PKEY_CTX_free);
    if (!ctx || EVP_PKEY_keygen_init(ctx.get()) != 1)
        throw std::runtime_error(opensslError("ed25519 keygen init failed"));

    EVP_PKEY* raw = nullptr;
    if (EVP_PKEY_keygen(ctx.get(), &raw) != 1 || !raw)
        throw std::runtime_error(opensslError("ed25519 keygen failed"));
    PkeyPtr pkey(raw, EVP_PKEY_free);

    KeyPair kp;
    kp.publicKey.resize(ED25519_PUBLIC_KEY_BYTES);
    kp.privateKey.resize(ED25519_PRIVATE_KEY_BYTES);
    size_t pubLen = kp.publicKey.size();
    size_t privLen = kp.privateKey.size();
    if (EVP_PKEY_get_raw_public_key(pkey.get(), kp.publicKey.data(), &pubLen) != 1 ||
        EVP_PKEY_get_raw_private_key(pkey.get(), kp.privateKey.data(), &privLen) != 1)
        throw std::runtime_error(opensslError("ed25519 raw key export failed"));

    LOG_D("[crypto]") << "generated ed25519 keypair " << Crypto::fingerprint(kp.publicKey);
    return kp;
}

Bytes Ed25519Signer::sign(const Bytes& message, const Bytes& privateKey) {
    if (privateKey.size() != ED25519_PRIVATE_KEY_BYTES)
        throw std::runtime_error("ed25519 sign: private key size mismatch");

    PkeyPtr pkey(EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr,
                                              privateKey.data(), privateKey.size()),
                 EVP_PKEY_free);
    if (!pkey)
        throw std::runtime_error(opensslError("ed25519 sign: bad private key"));

    MdCtxPtr ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (!ctx || EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, pkey.get()) != 1)
        throw std::runtime_error(opensslError("ed25519 sign init failed"));

    size_t sigLen = ED25519_SIGNATURE_BYTES;
    Bytes signature(sigLen);
    if (EVP_DigestSign(ctx.get(), signature.data(), &sigLen, message.data(),
                       message.size()) != 1)
        throw std::runtime_error(opensslError("ed25519 sign failed"));
    signature.resize(sigLen);
    return signature;
}

bool Ed25519Signer::verify(const Bytes& message, const Bytes& signature,
                           const Bytes& publicKey) {
    if (publicKey.size() != ED25519_PUBLIC_KEY_BYTES ||
        signature.size() != ED25519_SIGNATURE_BYTES)
        return false;

    PkeyPtr pkey(EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr,
                                             publicKey.data(), publicKey.size()),
                 EVP_PKEY_free);
    if (!pkey) {
        ERR_clear_error();
        return false;
    }

    MdCtxPtr ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (!ctx || EVP_DigestVerifyInit(ctx.get(), nullptr, nullptr, nullptr, pkey.get()) != 1) {
        ERR_clear_error();
        return false;
    }

    int rc = EVP_DigestVerify(ctx.get(), signature.data(), signature.size(),
                              message.data(), message.size());
    if (rc != 1)
        ERR_clear_error();
    return rc == 1;
}
