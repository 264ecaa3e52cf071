#ifndef CONCORD_DIGEST_HPP
#define CONCORD_DIGEST_HPP

#include <nlohmann/json.hpp>
#include <string>

#include "keys.hpp"

namespace Concord {

    /**
     * @brief One-way SHA-256 digest used to keep raw values out of every log.
     *
     * A JSON string is hashed over its raw UTF-8 bytes, so digest("AAPL") equals
     * sha256("AAPL"). Any other value is hashed over its compact canonical dump
     * (object keys sorted). The mapping is deterministic and has no configuration.
     */
    class ContentDigest {
    public:
        /**
         * @throws Concord::InvalidArgument if a non-string value holds strings that are not valid UTF-8.
         */
        static std::string digest(const nlohmann::json& value);

        static std::string digest_bytes(const byte_vector& data);
    };

} // namespace Concord

#endif // CONCORD_DIGEST_HPP
