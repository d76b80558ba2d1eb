#ifndef ED25519_SIGNER_H
#define ED25519_SIGNER_H

#include "crypto/signer.h"

#define ED25519_PUBLIC_KEY_BYTES  32
#define ED25519_PRIVATE_KEY_BYTES 32
#define ED25519_SIGNATURE_BYTES   64

// Ed25519 over OpenSSL EVP with raw 32-byte keys.
class Ed25519Signer : public Signer {
public:
    std::string name() const override { return "ed25519"; }
    KeyPair generateKeyPair() override;
    Bytes sign(const Bytes& message, const Bytes& privateKey) override;
    bool verify(const Bytes& message, const Bytes& signature,
                const Bytes& publicKey) override;
};

#endif // ED25519_SIGNER_H
