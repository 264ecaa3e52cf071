#include "concord/handshake.hpp"
#include "concord/errors.hpp"
#include "concord/handshake_messages.hpp"

namespace Concord {

void to_json(nlohmann::json& j, const HandshakeResult& r) {
    j = nlohmann::json{
        {"agent_a", r.agent_a},
        {"agent_b", r.agent_b},
        {"agent_a_id", r.agent_a_id},
        {"agent_b_id", r.agent_b_id},
        {"session_id", r.session_id},
        {"event_a_hash", r.event_a_hash},
        {"event_b_hash", r.event_b_hash},
        {"timestamp", r.timestamp},
    };
}

void from_json(const nlohmann::json& j, HandshakeResult& r) {
    j.at("agent_a").get_to(r.agent_a);
    j.at("agent_b").get_to(r.agent_b);
    j.at("agent_a_id").get_to(r.agent_a_id);
    j.at("agent_b_id").get_to(r.agent_b_id);
    j.at("session_id").get_to(r.session_id);
    j.at("event_a_hash").get_to(r.event_a_hash);
    j.at("event_b_hash").get_to(r.event_b_hash);
    j.at("timestamp").get_to(r.timestamp);
}

HandshakeCoordinator::HandshakeCoordinator(std::string session_id, Clock clock)
    : session_id_(std::move(session_id)), clock_(std::move(clock)) {
    if (!clock_) {
        clock_ = system_clock();
    }
}

HandshakeResult HandshakeCoordinator::perform(IdentityMember& initiator, IdentityMember& responder) const {
    if (&initiator == &responder || initiator.agent_id() == responder.agent_id()) {
        throw InvalidArgument("An agent cannot perform a handshake with itself.");
    }

    // 1. Initiator creates the proposal
    IdentityProposal proposal = initiator.propose(
        SESSION_CAPABILITIES, {{"session_id", session_id_}, {"name", initiator.name()}});

    // 2. Responder verifies it and answers
    IdentityResponse response = responder.respond(proposal, SESSION_CAPABILITIES);

    // 3. Co-signed event in the initiator's log
    Event event_a = initiator.stamp_handshake(
        proposal, response, {{"session_id", session_id_}, {"peer_name", responder.name()}});

    // 4. Co-signed event in the responder's log
    Event event_b = responder.stamp_handshake(
        proposal, response, {{"session_id", session_id_}, {"peer_name", initiator.name()}});

    HandshakeResult result;
    result.agent_a = initiator.name();
    result.agent_b = responder.name();
    result.agent_a_id = initiator.agent_id();
    result.agent_b_id = responder.agent_id();
    result.session_id = session_id_;
    result.event_a_hash = event_a.hash();
    result.event_b_hash = event_b.hash();
    result.timestamp = unix_seconds(clock_());
    return result;
}

} // namespace Concord
