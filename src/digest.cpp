#include "concord/digest.hpp"

#include "concord/crypto.hpp"
#include "concord/errors.hpp"

namespace Concord {

    std::string ContentDigest::digest(const nlohmann::json& value) {
        if (value.is_string()) {
            return Crypto::sha256_hex(value.get<std::string>());
        }
        try {
            return Crypto::sha256_hex(value.dump());
        } catch (const nlohmann::json::type_error& e) {
            throw InvalidArgument(std::string("Value cannot be digested: ") + e.what());
        }
    }

    std::string ContentDigest::digest_bytes(const byte_vector& data) {
        return Crypto::to_hex(Crypto::sha256(data));
    }

}  // namespace Concord
