#include "concord/version.hpp"

namespace Concord {

    std::string version_tag(Version version) {
        return "CONCORD-" + std::to_string(version >> 8) + "." + std::to_string(version & 0xFF);
    }

    std::optional<Version> VersionNegotiator::negotiate(const std::vector<Version>& initiator_versions,
                                                        const std::vector<Version>& responder_versions) {
        for (const auto& initiator_version : initiator_versions) {
            for (const auto& responder_version : responder_versions) {
                if (initiator_version == responder_version) {
                    return initiator_version;
                }
            }
        }
        return std::nullopt;
    }

}  // namespace Concord
