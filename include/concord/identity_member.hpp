#ifndef CONCORD_IDENTITY_MEMBER_HPP
#define CONCORD_IDENTITY_MEMBER_HPP

#include <nlohmann/json.hpp>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "config.hpp"
#include "event.hpp"
#include "event_store.hpp"
#include "handshake_messages.hpp"
#include "identity.hpp"

namespace Concord {

    /**
     * @brief One agent in a session: its identity and its private, hash-chained log.
     *
     * The private key never leaves this object. Every event enters the log through
     * commit(): the event is persisted first and only then becomes the new chain head,
     * so a store failure never leaves the head pointing at an event the store lacks.
     *
     * Not thread-safe; calls on one member must be serialized by the caller.
     */
    class IdentityMember {
    public:
        IdentityMember(std::string name, Identity identity, std::shared_ptr<EventStore> store, Clock clock);

        const std::string& name() const;
        const std::string& agent_id() const;
        const PublicKey& public_key() const;

        /**
         * @brief Hash of the last event in the log, or "genesis" when empty.
         */
        const std::string& chain_head() const;

        /**
         * @brief A copy of the log; changing it does not affect this member.
         */
        std::vector<Event> events() const;

        size_t event_count() const;

        /**
         * @brief Signs, persists and appends one event.
         *
         * The payload is merged with event_type, session_id, protocol_version and,
         * when given, peer_agent_id / peer_signature.
         *
         * @throws Concord::CryptoError if signing fails.
         * @throws Concord::PersistenceError if the store rejects the event; the chain is left unchanged.
         */
        Event stamp(const std::string& event_type,
                    const nlohmann::json& payload,
                    const std::string& session_id,
                    const std::optional<std::string>& peer_id = std::nullopt,
                    const std::optional<std::string>& peer_signature = std::nullopt);

        // --- Handshake Methods ---

        /**
         * @brief [INITIATOR] Signs an identity proposal.
         */
        IdentityProposal propose(const std::vector<std::string>& capabilities, const nlohmann::json& metadata) const;

        /**
         * @brief [RESPONDER] Verifies a proposal and signs a response to it.
         */
        IdentityResponse respond(const IdentityProposal& proposal, const std::vector<std::string>& capabilities) const;

        /**
         * @brief Co-signs a completed (proposal, response) pair into this member's log.
         * @param extension Extra payload fields (session_id, peer_name), signed with the event.
         */
        Event stamp_handshake(const IdentityProposal& proposal,
                              const IdentityResponse& response,
                              const nlohmann::json& extension);

    private:
        Event commit(Event event);
        int64_t now() const;

        std::string name_;
        Identity identity_;
        std::shared_ptr<EventStore> store_;
        Clock clock_;

        std::string chain_head_ = GENESIS_HASH;
        std::vector<Event> log_;
    };

} // namespace Concord

#endif // CONCORD_IDENTITY_MEMBER_HPP
