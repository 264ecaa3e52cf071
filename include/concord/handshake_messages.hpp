#ifndef CONCORD_HANDSHAKE_MESSAGES_HPP
#define CONCORD_HANDSHAKE_MESSAGES_HPP

#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>
#include <vector>

#include "event.hpp"
#include "identity.hpp"
#include "keys.hpp"
#include "version.hpp"

namespace Concord {

    // Capability vocabulary every session participant advertises.
    const std::vector<std::string> SESSION_CAPABILITIES = {"stamp", "verify", "a2a", "session"};

    // event_type of the co-signed handshake events.
    constexpr char HANDSHAKE_EVENT_TYPE[] = "a2a_handshake";

    // --- Handshake Data Structures ---

    // Step 1: the initiator announces and signs its identity.
    struct IdentityProposal {
        std::string agent_id;
        PublicKey public_key;
        std::vector<Version> supported_versions;
        std::vector<std::string> capabilities;
        nlohmann::json metadata = nlohmann::json::object();
        int64_t timestamp = 0;
        std::string nonce;
        Signature signature;

        nlohmann::json to_json() const;
        static IdentityProposal from_json(const nlohmann::json& j);

        byte_vector signing_bytes() const;
        std::string hash() const;

        /**
         * @brief [INITIATOR] Builds and signs a proposal.
         * @throws Concord::CryptoError if signing fails.
         */
        static IdentityProposal create(const Identity& identity,
                                       const std::vector<std::string>& capabilities,
                                       const nlohmann::json& metadata,
                                       int64_t timestamp);

        /**
         * @brief Checks the signature and that agent_id was derived from public_key.
         */
        bool verify() const;
    };

    // Step 2: the responder answers with its own signed identity, bound to the proposal.
    struct IdentityResponse {
        std::string agent_id;
        PublicKey public_key;
        Version selected_version = 0;
        std::vector<std::string> capabilities;
        std::string proposal_hash;
        Signature proposal_signature;
        int64_t timestamp = 0;
        std::string nonce;
        Signature signature;

        nlohmann::json to_json() const;
        static IdentityResponse from_json(const nlohmann::json& j);

        byte_vector signing_bytes() const;
        std::string hash() const;

        /**
         * @brief [RESPONDER] Verifies a proposal and answers it.
         * @throws Concord::CryptoError if the proposal does not verify.
         * @throws Concord::HandshakeError if no common protocol version exists.
         */
        static IdentityResponse create(const Identity& identity,
                                       const IdentityProposal& proposal,
                                       const std::vector<std::string>& capabilities,
                                       int64_t timestamp);

        bool verify() const;

        /**
         * @brief True if this response was built over exactly `proposal`.
         */
        bool answers(const IdentityProposal& proposal) const;
    };

    /**
     * @brief Steps 3/4: one side co-signs the (proposal, response) pair into its own log.
     *
     * The payload carries both messages, the negotiated protocol version, the peer's
     * agent id and this side's role, overlaid with `extension` (session id, peer name)
     * before signing.
     *
     * @param identity The side recording the event; must be the proposer or the responder.
     * @param previous_hash That side's current chain head.
     * @throws Concord::CryptoError if either message fails verification or signing fails.
     * @throws Concord::InvalidArgument if `identity` is neither party or the response does not answer the proposal.
     */
    Event build_cosigned_event(const Identity& identity,
                               const IdentityProposal& proposal,
                               const IdentityResponse& response,
                               const std::string& previous_hash,
                               const nlohmann::json& extension,
                               int64_t timestamp);

}  // namespace Concord

#endif  // CONCORD_HANDSHAKE_MESSAGES_HPP
