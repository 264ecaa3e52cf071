#ifndef CONCORD_AUDIT_HPP
#define CONCORD_AUDIT_HPP

#include <nlohmann/json.hpp>
#include <cstddef>
#include <string>
#include <vector>

#include "event.hpp"
#include "keys.hpp"

namespace Concord {

    /**
     * @brief Outcome of an audit. Every problem found is listed; valid() means none were.
     */
    struct AuditReport {
        std::vector<std::string> issues;
        size_t events_checked = 0;
        size_t handshakes_checked = 0;
        size_t interactions_checked = 0;

        bool valid() const { return issues.empty(); }
        void merge(const AuditReport& other);
    };

    /**
     * @brief Offline verification of agent logs and session exports.
     */
    class AuditVerifier {
    public:
        /**
         * @brief Checks one agent's log: genesis link, hash links, signatures and issuer id.
         */
        static AuditReport verify_chain(const std::vector<Event>& events,
                                        const PublicKey& public_key,
                                        const std::string& label = "chain");

        /**
         * @brief Checks an export document produced by SessionCoordinator::export_json().
         *
         * Beyond every agent chain, this cross-checks the session summary, that each
         * handshake record points at co-signed events in both logs built from the same
         * proposal and response, and that each responder-side interaction is matched by
         * the initiator's event (same interaction_hash, signature equal to peer_signature).
         */
        static AuditReport verify_export(const nlohmann::json& document);

        /**
         * @throws Concord::PersistenceError if the file cannot be read or parsed.
         */
        static AuditReport verify_export_file(const std::string& path);
    };

} // namespace Concord

#endif // CONCORD_AUDIT_HPP
