#include "concord/event.hpp"

#include "concord/crypto.hpp"
#include "concord/digest.hpp"
#include "concord/errors.hpp"
#include "concord/version.hpp"

namespace Concord {

namespace {

constexpr size_t NONCE_BYTES = 16;

template <typename T>
T require_field(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end()) {
        throw InvalidArgument(std::string("Event is missing field '") + key + "'.");
    }
    try {
        return it->get<T>();
    } catch (const nlohmann::json::exception&) {
        throw InvalidArgument(std::string("Event field '") + key + "' has the wrong type.");
    }
}

nlohmann::json unsigned_fields(const Event& event) {
    return {
        {"version", event.version},
        {"agent_id", event.agent_id},
        {"timestamp", event.timestamp},
        {"nonce", event.nonce},
        {"payload", event.payload},
        {"previous_hash", event.previous_hash},
    };
}

// Strings that are not valid UTF-8 cannot be serialized.
std::string canonical_dump(const nlohmann::json& j) {
    try {
        return j.dump();
    } catch (const nlohmann::json::type_error& e) {
        throw InvalidArgument(std::string("Event cannot be serialized: ") + e.what());
    }
}

} // namespace

nlohmann::json Event::to_json() const {
    nlohmann::json j = unsigned_fields(*this);
    j["signature"] = signature;
    return j;
}

Event Event::from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw InvalidArgument("Event must be a JSON object.");
    }
    Event event;
    event.version = require_field<std::string>(j, "version");
    event.agent_id = require_field<std::string>(j, "agent_id");
    event.timestamp = require_field<int64_t>(j, "timestamp");
    event.nonce = require_field<std::string>(j, "nonce");
    event.payload = require_field<nlohmann::json>(j, "payload");
    event.previous_hash = require_field<std::string>(j, "previous_hash");
    event.signature = require_field<std::string>(j, "signature");
    if (!event.payload.is_object()) {
        throw InvalidArgument("Event payload must be a JSON object.");
    }
    return event;
}

byte_vector Event::signing_bytes() const {
    // nlohmann::json keeps object keys sorted, so dump() is canonical.
    std::string canonical = canonical_dump(unsigned_fields(*this));
    return byte_vector(canonical.begin(), canonical.end());
}

std::string Event::hash() const {
    std::string canonical = canonical_dump(to_json());
    return ContentDigest::digest_bytes(byte_vector(canonical.begin(), canonical.end()));
}

std::string Event::event_type() const {
    auto it = payload.find("event_type");
    if (it == payload.end() || !it->is_string()) {
        return {};
    }
    return it->get<std::string>();
}

Event Event::sign(const PrivateKey& private_key,
                  const std::string& agent_id,
                  nlohmann::json payload,
                  const std::string& previous_hash,
                  int64_t timestamp) {
    Event event;
    event.version = version_tag(CURRENT_VERSION);
    event.agent_id = agent_id;
    event.timestamp = timestamp;
    event.nonce = Crypto::random_hex(NONCE_BYTES);
    event.payload = std::move(payload);
    event.previous_hash = previous_hash;

    Signature sig = Crypto::sign(event.signing_bytes(), private_key);
    event.signature = Crypto::to_hex(sig.data);
    return event;
}

bool Event::verify(const PublicKey& public_key) const {
    Signature sig;
    try {
        sig.data = Crypto::from_hex(signature);
    } catch (const InvalidArgument&) {
        return false;
    }
    return Crypto::verify(sig, signing_bytes(), public_key);
}

nlohmann::json build_event_payload(const nlohmann::json& base, const nlohmann::json& extension) {
    if (!base.is_object() || !extension.is_object()) {
        throw InvalidArgument("Event payloads must be JSON objects.");
    }
    nlohmann::json merged = base;
    for (auto it = extension.begin(); it != extension.end(); ++it) {
        merged[it.key()] = it.value();
    }
    return merged;
}

} // namespace Concord
