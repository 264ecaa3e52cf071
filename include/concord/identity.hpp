#ifndef CONCORD_IDENTITY_HPP
#define CONCORD_IDENTITY_HPP

#include <optional>
#include <string>

#include "keys.hpp"

namespace Concord {

    /**
     * @brief An agent's long-term identity: its signing key pair and the id derived from it.
     */
    struct Identity {
        std::string agent_id;
        KeyPair keys;

        /**
         * @brief Creates a fresh identity with a newly generated Ed25519 key pair.
         */
        static Identity generate();
    };

    /**
     * @brief Derives the stable agent id from a public key.
     *
     * The id is "agent_" followed by the hex of the first 16 bytes of SHA-256(public key).
     */
    std::string derive_agent_id(const PublicKey& public_key);

    /**
     * @brief Writes an identity file (JSON, private key included).
     * @throws Concord::PersistenceError if the file cannot be written.
     */
    void save_identity_file(const Identity& identity, const std::string& path);

    /**
     * @brief Where an agent's identity comes from: a JSON identity file or an identity already in memory.
     */
    class IdentitySource {
    public:
        static IdentitySource from_file(std::string path);
        static IdentitySource from_identity(Identity identity);

        /**
         * @brief Loads and validates the identity.
         * @throws Concord::ConfigurationError if the file is missing or malformed.
         * @throws Concord::CryptoError if the keys do not belong together or do not match the agent id.
         */
        Identity load() const;

        // The file path, or "<memory>" for in-memory identities.
        std::string describe() const;

    private:
        IdentitySource() = default;

        std::string path_;
        std::optional<Identity> identity_;
    };

} // namespace Concord

#endif // CONCORD_IDENTITY_HPP
