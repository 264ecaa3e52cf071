#ifndef CONCORD_HANDSHAKE_HPP
#define CONCORD_HANDSHAKE_HPP

#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>

#include "config.hpp"
#include "identity_member.hpp"

namespace Concord {

    /**
     * @brief Record of one completed pairwise handshake.
     */
    struct HandshakeResult {
        std::string agent_a;
        std::string agent_b;
        std::string agent_a_id;
        std::string agent_b_id;
        std::string session_id;
        std::string event_a_hash;  // Hash of the co-signed event in agent_a's log
        std::string event_b_hash;  // Hash of the co-signed event in agent_b's log
        int64_t timestamp = 0;
    };

    void to_json(nlohmann::json& j, const HandshakeResult& r);
    void from_json(const nlohmann::json& j, HandshakeResult& r);

    /**
     * @brief Runs the mutual identity handshake between two members of one session.
     *
     *   1. initiator signs an IdentityProposal bound to the session and its name
     *   2. responder verifies it and signs an IdentityResponse over it
     *   3. initiator co-signs (proposal, response) into its own log
     *   4. responder co-signs the same pair into its own log
     *
     * Any failure aborts the pair and propagates. If step 4 fails after step 3 was
     * committed, the initiator's event stays in its log (logs are append-only) and
     * no HandshakeResult is produced.
     */
    class HandshakeCoordinator {
    public:
        HandshakeCoordinator(std::string session_id, Clock clock);

        HandshakeResult perform(IdentityMember& initiator, IdentityMember& responder) const;

    private:
        std::string session_id_;
        Clock clock_;
    };

} // namespace Concord

#endif // CONCORD_HANDSHAKE_HPP
