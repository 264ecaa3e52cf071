#include "concord/handshake_messages.hpp"
#include "concord/crypto.hpp"
#include "concord/digest.hpp"
#include "concord/errors.hpp"

namespace Concord {

namespace {

constexpr size_t NONCE_BYTES = 16;

byte_vector canonical_bytes(const nlohmann::json& j) {
    std::string canonical = j.dump();
    return byte_vector(canonical.begin(), canonical.end());
}

Signature signature_from_hex(const std::string& hex) {
    Signature sig;
    sig.data = Crypto::from_hex(hex);
    return sig;
}

PublicKey public_key_from_hex(const std::string& hex) {
    PublicKey pk;
    pk.data = Crypto::from_hex(hex);
    return pk;
}

nlohmann::json proposal_body(const IdentityProposal& p) {
    return {
        {"agent_id", p.agent_id},
        {"public_key", Crypto::to_hex(p.public_key.data)},
        {"supported_versions", p.supported_versions},
        {"capabilities", p.capabilities},
        {"metadata", p.metadata},
        {"timestamp", p.timestamp},
        {"nonce", p.nonce},
    };
}

nlohmann::json response_body(const IdentityResponse& r) {
    return {
        {"agent_id", r.agent_id},
        {"public_key", Crypto::to_hex(r.public_key.data)},
        {"selected_version", r.selected_version},
        {"capabilities", r.capabilities},
        {"proposal_hash", r.proposal_hash},
        {"proposal_signature", Crypto::to_hex(r.proposal_signature.data)},
        {"timestamp", r.timestamp},
        {"nonce", r.nonce},
    };
}

// Malformed message JSON surfaces as InvalidArgument, like malformed events.
template <typename Fn>
auto parse_message(const char* what, Fn&& fn) -> decltype(fn()) {
    try {
        return fn();
    } catch (const nlohmann::json::exception& e) {
        throw InvalidArgument(std::string("Invalid ") + what + " data: " + e.what());
    }
}

} // namespace

// IdentityProposal

nlohmann::json IdentityProposal::to_json() const {
    nlohmann::json j = proposal_body(*this);
    j["signature"] = Crypto::to_hex(signature.data);
    return j;
}

IdentityProposal IdentityProposal::from_json(const nlohmann::json& j) {
    return parse_message("IdentityProposal", [&j]() {
        IdentityProposal p;
        p.agent_id = j.at("agent_id").get<std::string>();
        p.public_key = public_key_from_hex(j.at("public_key").get<std::string>());
        p.supported_versions = j.at("supported_versions").get<std::vector<Version>>();
        p.capabilities = j.at("capabilities").get<std::vector<std::string>>();
        p.metadata = j.at("metadata");
        p.timestamp = j.at("timestamp").get<int64_t>();
        p.nonce = j.at("nonce").get<std::string>();
        p.signature = signature_from_hex(j.at("signature").get<std::string>());
        return p;
    });
}

byte_vector IdentityProposal::signing_bytes() const {
    return canonical_bytes(proposal_body(*this));
}

std::string IdentityProposal::hash() const {
    return ContentDigest::digest(to_json());
}

IdentityProposal IdentityProposal::create(const Identity& identity,
                                          const std::vector<std::string>& capabilities,
                                          const nlohmann::json& metadata,
                                          int64_t timestamp) {
    IdentityProposal p;
    p.agent_id = identity.agent_id;
    p.public_key = identity.keys.publicKey;
    p.supported_versions = SUPPORTED_VERSIONS;
    p.capabilities = capabilities;
    p.metadata = metadata;
    p.timestamp = timestamp;
    p.nonce = Crypto::random_hex(NONCE_BYTES);
    p.signature = Crypto::sign(p.signing_bytes(), identity.keys.privateKey);
    return p;
}

bool IdentityProposal::verify() const {
    if (agent_id != derive_agent_id(public_key)) {
        return false;
    }
    return Crypto::verify(signature, signing_bytes(), public_key);
}


// IdentityResponse

nlohmann::json IdentityResponse::to_json() const {
    nlohmann::json j = response_body(*this);
    j["signature"] = Crypto::to_hex(signature.data);
    return j;
}

IdentityResponse IdentityResponse::from_json(const nlohmann::json& j) {
    return parse_message("IdentityResponse", [&j]() {
        IdentityResponse r;
        r.agent_id = j.at("agent_id").get<std::string>();
        r.public_key = public_key_from_hex(j.at("public_key").get<std::string>());
        r.selected_version = j.at("selected_version").get<Version>();
        r.capabilities = j.at("capabilities").get<std::vector<std::string>>();
        r.proposal_hash = j.at("proposal_hash").get<std::string>();
        r.proposal_signature = signature_from_hex(j.at("proposal_signature").get<std::string>());
        r.timestamp = j.at("timestamp").get<int64_t>();
        r.nonce = j.at("nonce").get<std::string>();
        r.signature = signature_from_hex(j.at("signature").get<std::string>());
        return r;
    });
}

byte_vector IdentityResponse::signing_bytes() const {
    return canonical_bytes(response_body(*this));
}

std::string IdentityResponse::hash() const {
    return ContentDigest::digest(to_json());
}

IdentityResponse IdentityResponse::create(const Identity& identity,
                                          const IdentityProposal& proposal,
                                          const std::vector<std::string>& capabilities,
                                          int64_t timestamp) {
    // 1. The proposal must be signed by the key its agent id was derived from
    if (!proposal.verify()) {
        throw CryptoError("Identity proposal from " + proposal.agent_id + " failed verification.");
    }

    // 2. Select a common protocol version
    auto selected = VersionNegotiator::negotiate(proposal.supported_versions, SUPPORTED_VERSIONS);
    if (!selected) {
        throw HandshakeError("Agent " + proposal.agent_id + " does not support a compatible version.");
    }

    // 3. Bind our identity to the exact proposal and sign
    IdentityResponse r;
    r.agent_id = identity.agent_id;
    r.public_key = identity.keys.publicKey;
    r.selected_version = *selected;
    r.capabilities = capabilities;
    r.proposal_hash = proposal.hash();
    r.proposal_signature = proposal.signature;
    r.timestamp = timestamp;
    r.nonce = Crypto::random_hex(NONCE_BYTES);
    r.signature = Crypto::sign(r.signing_bytes(), identity.keys.privateKey);
    return r;
}

bool IdentityResponse::verify() const {
    if (agent_id != derive_agent_id(public_key)) {
        return false;
    }
    return Crypto::verify(signature, signing_bytes(), public_key);
}

bool IdentityResponse::answers(const IdentityProposal& proposal) const {
    return proposal_hash == proposal.hash() && proposal_signature.data == proposal.signature.data;
}


// Co-signed handshake event

Event build_cosigned_event(const Identity& identity,
                           const IdentityProposal& proposal,
                           const IdentityResponse& response,
                           const std::string& previous_hash,
                           const nlohmann::json& extension,
                           int64_t timestamp) {
    if (!proposal.verify()) {
        throw CryptoError("Identity proposal from " + proposal.agent_id + " failed verification.");
    }
    if (!response.verify()) {
        throw CryptoError("Identity response from " + response.agent_id + " failed verification.");
    }
    if (!response.answers(proposal)) {
        throw InvalidArgument("Identity response does not answer the given proposal.");
    }

    bool is_initiator = identity.agent_id == proposal.agent_id;
    if (!is_initiator && identity.agent_id != response.agent_id) {
        throw InvalidArgument("Agent " + identity.agent_id + " is not a party to this handshake.");
    }

    nlohmann::json base = {
        {"event_type", HANDSHAKE_EVENT_TYPE},
        {"protocol_version", version_tag(response.selected_version)},
        {"proposal", proposal.to_json()},
        {"response", response.to_json()},
        {"peer_agent_id", is_initiator ? response.agent_id : proposal.agent_id},
        {"my_role", is_initiator ? "initiator" : "responder"},
    };

    return Event::sign(identity.keys.privateKey,
                       identity.agent_id,
                       build_event_payload(base, extension),
                       previous_hash,
                       timestamp);
}

}  // namespace Concord
