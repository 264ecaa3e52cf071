#ifndef CONCORD_VERSION_HPP
#define CONCORD_VERSION_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace Concord {

    // Protocol version is represented as a 16-bit integer.
    // For example, version 1.0 is 0x0100, 1.1 is 0x0101.
    using Version = uint16_t;

    namespace Versions {
        constexpr Version V1_0 = 0x0100;
    }

    // A list of supported versions, in descending order of preference.
    const std::vector<Version> SUPPORTED_VERSIONS = {Versions::V1_0};

    // The version every locally stamped event is tagged with.
    constexpr Version CURRENT_VERSION = Versions::V1_0;

    /**
     * @brief Formats a version as the tag embedded in event payloads, e.g. "CONCORD-1.0".
     */
    std::string version_tag(Version version);

    /**
     * @brief Handles the logic for negotiating a common protocol version.
     */
    class VersionNegotiator {
    public:
        /**
         * @brief Selects the best common version between an initiator and a responder.
         *
         * It iterates through the initiator's preferred versions and returns the first
         * one that is also present in the responder's list of supported versions.
         *
         * @param initiator_versions Versions advertised in the identity proposal, in descending order of preference.
         * @param responder_versions Versions supported by the responding agent.
         * @return The selected version, or std::nullopt if no common version is found.
         */
        static std::optional<Version> negotiate(const std::vector<Version>& initiator_versions,
                                                const std::vector<Version>& responder_versions);
    };

}  // namespace Concord

#endif  // CONCORD_VERSION_HPP
