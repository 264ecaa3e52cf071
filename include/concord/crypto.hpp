#ifndef CONCORD_CRYPTO_HPP
#define CONCORD_CRYPTO_HPP

#include "keys.hpp"
#include <cstddef>
#include <string>

namespace Concord {

    class Crypto {
    public:
        /**
         * @brief Initializes the cryptographic library. Must be called once.
         * @return 0 on success, -1 on error.
         */
        static int init();

        /**
         * @brief Generates an Ed25519 key pair for digital signatures.
         * @return A KeyPair object.
         */
        static KeyPair generate_sign_keypair();

        /**
         * @brief Extracts the public half embedded in an Ed25519 secret key.
         * @throws Concord::CryptoError if the private key has the wrong size.
         */
        static PublicKey public_key_from_private(const PrivateKey& private_key);

        /**
         * @brief Creates a digital signature for a given message.
         * @param message The data to sign.
         * @param private_key The signer's private key.
         * @return A Signature object.
         * @throws Concord::CryptoError if the key is malformed or signing fails.
         */
        static Signature sign(const byte_vector& message, const PrivateKey& private_key);

        /**
         * @brief Verifies a digital signature.
         * @param signature The signature to verify.
         * @param message The message that was signed.
         * @param public_key The signer's public key.
         * @return True if the signature is valid, false otherwise.
         */
        static bool verify(const Signature& signature, const byte_vector& message, const PublicKey& public_key);

        /**
         * @brief SHA-256 of a byte sequence.
         */
        static byte_vector sha256(const byte_vector& data);

        /**
         * @brief SHA-256 of a string, returned as lowercase hex.
         */
        static std::string sha256_hex(const std::string& data);

        static std::string to_hex(const byte_vector& data);

        /**
         * @brief Decodes lowercase or uppercase hex.
         * @throws Concord::InvalidArgument on odd length or non-hex characters.
         */
        static byte_vector from_hex(const std::string& hex);

        /**
         * @brief Hex encoding of `num_bytes` bytes from the libsodium CSPRNG.
         */
        static std::string random_hex(size_t num_bytes);
    };

} // namespace Concord

#endif // CONCORD_CRYPTO_HPP
