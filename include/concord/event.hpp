#ifndef CONCORD_EVENT_HPP
#define CONCORD_EVENT_HPP

#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>

#include "keys.hpp"

namespace Concord {

    // previous_hash of the first event in every agent's log.
    constexpr char GENESIS_HASH[] = "genesis";

    /**
     * @brief One signed entry in an agent's append-only log.
     *
     * The signature covers the canonical encoding of every other field.
     * The event hash covers the canonical encoding of the whole event,
     * signature included, and is what the next event links to.
     */
    struct Event {
        std::string version;        // Protocol version tag, e.g. "CONCORD-1.0"
        std::string agent_id;       // Issuing agent
        int64_t timestamp = 0;      // Unix seconds
        std::string nonce;
        nlohmann::json payload = nlohmann::json::object();
        std::string previous_hash;  // Issuing agent's chain head when stamped
        std::string signature;      // Hex encoded Ed25519 signature

        /**
         * @brief Full JSON form, as persisted and exported.
         */
        nlohmann::json to_json() const;

        /**
         * @brief Parses an event from its JSON form.
         * @throws Concord::InvalidArgument if a required field is missing or has the wrong type.
         */
        static Event from_json(const nlohmann::json& j);

        /**
         * @brief Canonical bytes that the signature is computed over.
         */
        byte_vector signing_bytes() const;

        /**
         * @brief SHA-256 hex digest of the complete event.
         */
        std::string hash() const;

        std::string event_type() const;

        /**
         * @brief Signs a new event with the given key.
         * @param private_key Issuing agent's signing key.
         * @param agent_id Issuing agent's id.
         * @param payload Fully merged payload.
         * @param previous_hash The issuing agent's current chain head.
         * @param timestamp Unix seconds.
         * @throws Concord::CryptoError if signing fails.
         * @throws Concord::InvalidArgument if a string in the event is not valid UTF-8.
         */
        static Event sign(const PrivateKey& private_key,
                          const std::string& agent_id,
                          nlohmann::json payload,
                          const std::string& previous_hash,
                          int64_t timestamp);

        /**
         * @brief Checks the signature against the issuer's public key.
         */
        bool verify(const PublicKey& public_key) const;
    };

    /**
     * @brief Returns a new payload holding `base` overlaid with `extension`.
     *
     * Keys present in both take the value from `extension`. Neither input is modified.
     * @throws Concord::InvalidArgument if either input is not a JSON object.
     */
    nlohmann::json build_event_payload(const nlohmann::json& base, const nlohmann::json& extension);

} // namespace Concord

#endif // CONCORD_EVENT_HPP
