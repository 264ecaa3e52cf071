#include "concord/crypto.hpp"

#include <sodium.h>

#include <atomic>

#include "concord/errors.hpp"

namespace Concord {

    static std::atomic<bool> g_sodium_initialized = false;

    int Crypto::init() {
        if (g_sodium_initialized) {
            return 0;  // Already successfully initialized
        }

        if (sodium_init() < 0) {
            return -1;  // Initialization failed
        }

        g_sodium_initialized = true;
        return 0;
    }

    KeyPair Crypto::generate_sign_keypair() {
        KeyPair kp;
        kp.publicKey.data.resize(crypto_sign_PUBLICKEYBYTES);
        kp.privateKey.data.resize(crypto_sign_SECRETKEYBYTES);
        crypto_sign_keypair(kp.publicKey.data.data(), kp.privateKey.data.data());
        return kp;
    }

    PublicKey Crypto::public_key_from_private(const PrivateKey& private_key) {
        if (private_key.data.size() != crypto_sign_SECRETKEYBYTES) {
            throw CryptoError("Invalid private key size.");
        }
        PublicKey pk;
        pk.data.resize(crypto_sign_PUBLICKEYBYTES);
        if (crypto_sign_ed25519_sk_to_pk(pk.data.data(), private_key.data.data()) != 0) {
            throw CryptoError("Failed to derive public key from private key.");
        }
        return pk;
    }

    Signature Crypto::sign(const byte_vector& message, const PrivateKey& private_key) {
        if (private_key.data.size() != crypto_sign_SECRETKEYBYTES) {
            throw CryptoError("Invalid private key size for signing.");
        }
        Signature sig;
        sig.data.resize(crypto_sign_BYTES);
        if (crypto_sign_detached(sig.data.data(), nullptr, message.data(), message.size(), private_key.data.data()) !=
            0) {
            throw CryptoError("Failed to sign message.");
        }
        return sig;
    }

    bool Crypto::verify(const Signature& signature, const byte_vector& message, const PublicKey& public_key) {
        if (signature.data.size() != crypto_sign_BYTES || public_key.data.size() != crypto_sign_PUBLICKEYBYTES) {
            return false;  // Invalid sizes
        }
        return crypto_sign_verify_detached(
                   signature.data.data(), message.data(), message.size(), public_key.data.data()) == 0;
    }

    byte_vector Crypto::sha256(const byte_vector& data) {
        byte_vector out(crypto_hash_sha256_BYTES);
        crypto_hash_sha256(out.data(), data.data(), data.size());
        return out;
    }

    std::string Crypto::sha256_hex(const std::string& data) {
        return to_hex(sha256(byte_vector(data.begin(), data.end())));
    }

    std::string Crypto::to_hex(const byte_vector& data) {
        std::string hex(data.size() * 2 + 1, '\0');
        sodium_bin2hex(hex.data(), hex.size(), data.data(), data.size());
        hex.pop_back();  // Drop the terminator written by sodium_bin2hex
        return hex;
    }

    byte_vector Crypto::from_hex(const std::string& hex) {
        if (hex.size() % 2 != 0) {
            throw InvalidArgument("Hex string has an odd length.");
        }
        byte_vector out(hex.size() / 2);
        size_t decoded_len = 0;
        const char* end = nullptr;
        if (sodium_hex2bin(out.data(), out.size(), hex.data(), hex.size(), nullptr, &decoded_len, &end) != 0 ||
            decoded_len != out.size()) {
            throw InvalidArgument("Hex string contains invalid characters.");
        }
        return out;
    }

    std::string Crypto::random_hex(size_t num_bytes) {
        byte_vector buf(num_bytes);
        randombytes_buf(buf.data(), buf.size());
        return to_hex(buf);
    }

}  // namespace Concord
