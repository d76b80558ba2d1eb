#ifndef SIGNER_H
#define SIGNER_H

#include "crypto_utils.h"
#include <string>

struct KeyPair {
    Bytes publicKey;
    Bytes privateKey;
};

// Signature capability used by the gossip layer. Implementations throw
// std::runtime_error when the backend itself is unusable; verify() only
// answers yes/no and never throws for malformed input.
class Signer {
public:
    virtual ~Signer() = default;

    virtual std::string name() const = 0;
    virtual KeyPair generateKeyPair() = 0;
    virtual Bytes sign(const Bytes& message, const Bytes& privateKey) = 0;
    virtual bool verify(const Bytes& message, const Bytes& signature,
                        const Bytes& publicKey) = 0;
};

#endif // SIGNER_H
