#include "concord/identity_member.hpp"
#include "concord/errors.hpp"
#include "concord/version.hpp"

namespace Concord {

IdentityMember::IdentityMember(std::string name, Identity identity, std::shared_ptr<EventStore> store, Clock clock)
    : name_(std::move(name)), identity_(std::move(identity)), store_(std::move(store)), clock_(std::move(clock)) {
    if (!store_) {
        throw InvalidArgument("IdentityMember requires an event store.");
    }
    if (!clock_) {
        clock_ = system_clock();
    }
}

const std::string& IdentityMember::name() const {
    return name_;
}

const std::string& IdentityMember::agent_id() const {
    return identity_.agent_id;
}

const PublicKey& IdentityMember::public_key() const {
    return identity_.keys.publicKey;
}

const std::string& IdentityMember::chain_head() const {
    return chain_head_;
}

std::vector<Event> IdentityMember::events() const {
    return log_;
}

size_t IdentityMember::event_count() const {
    return log_.size();
}

Event IdentityMember::stamp(const std::string& event_type,
                            const nlohmann::json& payload,
                            const std::string& session_id,
                            const std::optional<std::string>& peer_id,
                            const std::optional<std::string>& peer_signature) {
    nlohmann::json extension = {
        {"event_type", event_type},
        {"session_id", session_id},
        {"protocol_version", version_tag(CURRENT_VERSION)},
    };
    if (peer_id) {
        extension["peer_agent_id"] = *peer_id;
    }
    if (peer_signature) {
        extension["peer_signature"] = *peer_signature;
    }

    return commit(Event::sign(identity_.keys.privateKey,
                              identity_.agent_id,
                              build_event_payload(payload, extension),
                              chain_head_,
                              now()));
}

// --- Handshake ---

IdentityProposal IdentityMember::propose(const std::vector<std::string>& capabilities,
                                         const nlohmann::json& metadata) const {
    return IdentityProposal::create(identity_, capabilities, metadata, now());
}

IdentityResponse IdentityMember::respond(const IdentityProposal& proposal,
                                         const std::vector<std::string>& capabilities) const {
    return IdentityResponse::create(identity_, proposal, capabilities, now());
}

Event IdentityMember::stamp_handshake(const IdentityProposal& proposal,
                                      const IdentityResponse& response,
                                      const nlohmann::json& extension) {
    return commit(build_cosigned_event(identity_, proposal, response, chain_head_, extension, now()));
}

// --- Chain ---

Event IdentityMember::commit(Event event) {
    if (event.previous_hash != chain_head_) {
        throw LogicError("Event does not extend the chain head of agent " + name_ + ".");
    }

    store_->persist(event);

    chain_head_ = event.hash();
    log_.push_back(event);
    return event;
}

int64_t IdentityMember::now() const {
    return unix_seconds(clock_());
}

} // namespace Concord
