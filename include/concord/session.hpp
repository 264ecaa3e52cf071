#ifndef CONCORD_SESSION_HPP
#define CONCORD_SESSION_HPP

#include <nlohmann/json.hpp>
#include <cstdint>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "config.hpp"
#include "event.hpp"
#include "handshake.hpp"
#include "identity_member.hpp"

namespace Concord {

    enum class SessionState {
        NOT_STARTED,
        STARTED,
        ENDED,
        FAILED  // start() or a co-signed stamp() failed halfway; terminal
    };

    const char* to_string(SessionState state);

    struct AgentSummary {
        std::string name;
        std::string agent_id;
        size_t event_count = 0;
        std::string last_hash;
    };

    /**
     * @brief Point-in-time view of a session. Agents are listed in registration order.
     */
    struct SessionSummary {
        std::string session_id;
        std::optional<int64_t> started_at;
        std::vector<AgentSummary> agents;
        std::vector<HandshakeResult> handshakes;
        size_t handshake_count = 0;
        size_t total_events = 0;

        nlohmann::json to_json() const;
        static SessionSummary from_json(const nlohmann::json& j);
    };

    /**
     * @brief Multi-agent co-signed session.
     *
     * Owns a fixed, ordered registry of at least two agents. start() stamps a
     * session_start event into every log and runs a handshake for every pair;
     * afterwards stamp() records unilateral or co-signed interactions and end()
     * closes the session. Every event carries the shared session id.
     *
     * Calls must be serialized by the caller; there is no internal locking.
     */
    class SessionCoordinator {
    public:
        /**
         * @brief Loads every agent's identity and builds the registry.
         * @throws Concord::ConfigurationError with fewer than two agents, an empty, duplicate or non-UTF-8 name,
         *         or an identity source that cannot be loaded.
         * @throws Concord::CryptoError if the crypto library cannot be initialized or an identity is inconsistent.
         */
        explicit SessionCoordinator(std::vector<AgentDefinition> agents, SessionOptions options = {});

        /**
         * @brief Stamps session_start into every agent and performs all N*(N-1)/2 handshakes.
         * @return *this, for chaining.
         * @throws Concord::StateError unless the session is NOT_STARTED.
         */
        SessionCoordinator& start();

        /**
         * @brief Stamps an event for `agent_name`, co-signed with `peer` when given.
         *
         * Payload fields whose key ends in "_hash" or "_id" (and session_id) are stored as is;
         * every other field `k` is stored as `k_hash` = digest(value).
         *
         * @return The acting agent's event.
         * @throws Concord::StateError unless the session is STARTED.
         * @throws Concord::LookupError if agent_name or peer is not in the session.
         * @throws Concord::InvalidArgument if peer equals agent_name, the payload is not an object,
         *         a field `k` sits beside a field `k_hash`, or a string is not valid UTF-8.
         */
        Event stamp(const std::string& agent_name,
                    const std::string& event_type,
                    const nlohmann::json& payload,
                    const std::optional<std::string>& peer = std::nullopt);

        /**
         * @brief Stamps session_end into every agent and closes the session.
         * @throws Concord::StateError unless the session is STARTED.
         */
        SessionSummary end();

        SessionSummary summary() const;

        /**
         * @brief The full audit document: {"session": summary, "agents": {name: {agent_id, public_key, event_count, events}}}.
         * @throws Concord::StateError unless the session is STARTED or ENDED.
         */
        nlohmann::json export_json() const;

        /**
         * @brief Writes export_json() to a file.
         * @return output_path
         * @throws Concord::PersistenceError if the file cannot be written.
         */
        std::string export_audit(const std::string& output_path = "session-audit.json") const;

        void export_audit(std::ostream& out) const;

        const std::string& id() const;
        SessionState state() const;

        /**
         * @throws Concord::LookupError for an unknown name.
         */
        const IdentityMember& get_agent(const std::string& name) const;

        std::vector<std::string> agent_names() const;
        std::vector<HandshakeResult> handshakes() const;

        void set_on_progress_callback(ProgressCallback callback);

        /**
         * @brief Applies the redaction rule used by stamp() to a payload.
         */
        static nlohmann::json redact_payload(const nlohmann::json& payload);

    private:
        IdentityMember* find_agent(const std::string& name) const;
        void require_state(SessionState required, const char* operation) const;
        size_t total_events() const;
        void report(const std::string& message) const;

        std::string session_id_;
        std::optional<int64_t> started_at_;
        SessionState state_ = SessionState::NOT_STARTED;

        std::shared_ptr<EventStore> store_;
        Clock clock_;
        ProgressCallback on_progress_callback_;

        // Registration order; fixes the handshake pair order.
        std::vector<std::unique_ptr<IdentityMember>> agents_;
        std::vector<HandshakeResult> handshakes_;
    };

} // namespace Concord

#endif // CONCORD_SESSION_HPP
