#include "concord/identity.hpp"

#include <nlohmann/json.hpp>

#include <fstream>

#include "concord/crypto.hpp"
#include "concord/errors.hpp"

namespace Concord {

namespace {

constexpr char KEY_ALGORITHM[] = "Ed25519";
constexpr size_t AGENT_ID_BYTES = 16;

// Rejects key pairs that do not belong together or an id that was not derived from the key.
void validate_identity(const Identity& identity, const std::string& origin) {
    PublicKey embedded = Crypto::public_key_from_private(identity.keys.privateKey);
    if (embedded.data != identity.keys.publicKey.data) {
        throw CryptoError("Identity " + origin + ": public key does not match private key.");
    }
    if (identity.agent_id != derive_agent_id(identity.keys.publicKey)) {
        throw CryptoError("Identity " + origin + ": agent_id does not match public key.");
    }
}

Identity parse_identity_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigurationError("Cannot open identity file: " + path);
    }

    nlohmann::json j;
    try {
        in >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigurationError("Identity file " + path + " is not valid JSON: " + e.what());
    }

    Identity identity;
    try {
        if (j.value("algorithm", std::string(KEY_ALGORITHM)) != KEY_ALGORITHM) {
            throw ConfigurationError("Identity file " + path + " uses an unsupported key algorithm.");
        }
        identity.agent_id = j.at("agent_id").get<std::string>();
        identity.keys.publicKey.data = Crypto::from_hex(j.at("public_key").get<std::string>());
        identity.keys.privateKey.data = Crypto::from_hex(j.at("private_key").get<std::string>());
    } catch (const nlohmann::json::exception& e) {
        throw ConfigurationError("Identity file " + path + " is malformed: " + e.what());
    } catch (const InvalidArgument& e) {
        throw ConfigurationError("Identity file " + path + " has a malformed key: " + e.what());
    }
    return identity;
}

} // namespace

Identity Identity::generate() {
    Identity identity;
    identity.keys = Crypto::generate_sign_keypair();
    identity.agent_id = derive_agent_id(identity.keys.publicKey);
    return identity;
}

std::string derive_agent_id(const PublicKey& public_key) {
    byte_vector digest = Crypto::sha256(public_key.data);
    digest.resize(AGENT_ID_BYTES);
    return "agent_" + Crypto::to_hex(digest);
}

void save_identity_file(const Identity& identity, const std::string& path) {
    nlohmann::json j = {
        {"algorithm", KEY_ALGORITHM},
        {"agent_id", identity.agent_id},
        {"public_key", Crypto::to_hex(identity.keys.publicKey.data)},
        {"private_key", Crypto::to_hex(identity.keys.privateKey.data)},
    };

    std::ofstream out(path, std::ios::trunc);
    if (!out) {
        throw PersistenceError("Cannot open identity file for writing: " + path);
    }
    out << j.dump(2) << '\n';
    if (!out) {
        throw PersistenceError("Failed to write identity file: " + path);
    }
}

IdentitySource IdentitySource::from_file(std::string path) {
    IdentitySource source;
    source.path_ = std::move(path);
    return source;
}

IdentitySource IdentitySource::from_identity(Identity identity) {
    IdentitySource source;
    source.identity_ = std::move(identity);
    return source;
}

Identity IdentitySource::load() const {
    Identity identity = identity_ ? *identity_ : parse_identity_file(path_);
    validate_identity(identity, describe());
    return identity;
}

std::string IdentitySource::describe() const {
    return identity_ ? std::string("<memory>") : path_;
}

} // namespace Concord
