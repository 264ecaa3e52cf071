#ifndef CONCORD_KEYS_HPP
#define CONCORD_KEYS_HPP

#include <vector>
#include <cstdint>

namespace Concord {

    // Using a simple vector of bytes for data representation.
    using byte_vector = std::vector<uint8_t>;

    // An Ed25519 public key.
    struct PublicKey {
        std::vector<uint8_t> data;
    };

    // An Ed25519 secret key (seed followed by the public key, as libsodium lays it out).
    struct PrivateKey {
        std::vector<uint8_t> data;
    };

    // A key pair consisting of a public and a private key.
    struct KeyPair {
        PublicKey publicKey;
        PrivateKey privateKey;
    };

    // A detached digital signature.
    struct Signature {
        std::vector<uint8_t> data;
    };

} // namespace Concord

#endif // CONCORD_KEYS_HPP
