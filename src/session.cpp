#include "concord/session.hpp"
#include "concord/crypto.hpp"
#include "concord/digest.hpp"
#include "concord/errors.hpp"

#include <fstream>
#include <iostream>
#include <unordered_set>

namespace Concord {

namespace {

bool ends_with(const std::string& value, const std::string& suffix) {
    return value.size() >= suffix.size() && value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// dump() rejects strings that are not valid UTF-8.
bool is_serializable(const nlohmann::json& value) {
    try {
        value.dump();
    } catch (const nlohmann::json::type_error&) {
        return false;
    }
    return true;
}

std::string join(const std::vector<std::string>& parts, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            out += sep;
        }
        out += parts[i];
    }
    return out;
}

} // namespace

const char* to_string(SessionState state) {
    switch (state) {
        case SessionState::NOT_STARTED:
            return "not_started";
        case SessionState::STARTED:
            return "started";
        case SessionState::ENDED:
            return "ended";
        case SessionState::FAILED:
            return "failed";
    }
    return "unknown";
}

// --- SessionSummary ---

nlohmann::json SessionSummary::to_json() const {
    // JSON objects are keyed by name; agent_names keeps registration order.
    nlohmann::json agents_json = nlohmann::json::object();
    nlohmann::json agent_names = nlohmann::json::array();
    for (const auto& agent : agents) {
        agent_names.push_back(agent.name);
        agents_json[agent.name] = {
            {"agent_id", agent.agent_id},
            {"event_count", agent.event_count},
            {"last_hash", agent.last_hash},
        };
    }

    nlohmann::json j = {
        {"session_id", session_id},
        {"agents", agents_json},
        {"agent_names", agent_names},
        {"handshakes", handshakes},
        {"handshake_count", handshake_count},
        {"total_events", total_events},
    };
    j["started_at"] = started_at ? nlohmann::json(*started_at) : nlohmann::json(nullptr);
    return j;
}

SessionSummary SessionSummary::from_json(const nlohmann::json& j) {
    SessionSummary s;
    try {
        s.session_id = j.at("session_id").get<std::string>();
        if (!j.at("started_at").is_null()) {
            s.started_at = j.at("started_at").get<int64_t>();
        }
        const nlohmann::json& agents_json = j.at("agents");
        std::vector<std::string> names;
        if (j.contains("agent_names")) {
            names = j.at("agent_names").get<std::vector<std::string>>();
        } else {
            for (auto it = agents_json.begin(); it != agents_json.end(); ++it) {
                names.push_back(it.key());
            }
        }
        if (names.size() != agents_json.size() ||
            std::unordered_set<std::string>(names.begin(), names.end()).size() != names.size()) {
            throw InvalidArgument("Invalid session summary: agent_names does not list every agent.");
        }
        for (const auto& name : names) {
            const nlohmann::json& agent = agents_json.at(name);
            AgentSummary a;
            a.name = name;
            a.agent_id = agent.at("agent_id").get<std::string>();
            a.event_count = agent.at("event_count").get<size_t>();
            a.last_hash = agent.at("last_hash").get<std::string>();
            s.agents.push_back(a);
        }
        s.handshakes = j.at("handshakes").get<std::vector<HandshakeResult>>();
        s.handshake_count = j.at("handshake_count").get<size_t>();
        s.total_events = j.at("total_events").get<size_t>();
    } catch (const nlohmann::json::exception& e) {
        throw InvalidArgument(std::string("Invalid session summary: ") + e.what());
    }
    return s;
}

// --- SessionCoordinator ---

SessionCoordinator::SessionCoordinator(std::vector<AgentDefinition> agents, SessionOptions options)
    : store_(std::move(options.store)), clock_(std::move(options.clock)) {
    if (agents.size() < 2) {
        throw ConfigurationError(
            "A session requires at least 2 agents. "
            "For a single agent, stamp events on an IdentityMember directly.");
    }
    if (Crypto::init() != 0) {
        throw CryptoError("Failed to initialize crypto library.");
    }

    if (!store_) {
        store_ = std::make_shared<MemoryEventStore>();
    }
    if (!clock_) {
        clock_ = system_clock();
    }
    session_id_ = options.session_id_generator ? options.session_id_generator() : generate_session_id();
    if (session_id_.empty()) {
        throw ConfigurationError("Session id generator returned an empty id.");
    }

    // Build agent registry
    std::unordered_set<std::string> names;
    agents_.reserve(agents.size());
    for (auto& def : agents) {
        if (def.name.empty()) {
            throw ConfigurationError("Agent names must not be empty.");
        }
        if (!is_serializable(nlohmann::json(def.name))) {
            throw ConfigurationError("Agent names must be valid UTF-8.");
        }
        if (!names.insert(def.name).second) {
            throw ConfigurationError("Duplicate agent name: " + def.name);
        }
        agents_.push_back(std::make_unique<IdentityMember>(def.name, def.identity.load(), store_, clock_));
    }

    on_progress_callback_ = [](const std::string& message) {
        std::cout << "[Concord Session] " << message << std::endl;
    };
}

SessionCoordinator& SessionCoordinator::start() {
    if (state_ == SessionState::STARTED) {
        throw StateError("Session " + session_id_ + " already started. Create a new session to start again.");
    }
    require_state(SessionState::NOT_STARTED, "start");

    try {
        started_at_ = unix_seconds(clock_());

        std::vector<std::string> participants;
        std::vector<std::string> participant_names;
        for (const auto& agent : agents_) {
            participants.push_back(agent->agent_id());
            participant_names.push_back(agent->name());
        }

        // 1. Every log opens with who is in the session
        for (auto& agent : agents_) {
            agent->stamp("session_start",
                         {
                             {"session_id", session_id_},
                             {"participants", participants},
                             {"participant_names", participant_names},
                             {"agent_count", agents_.size()},
                         },
                         session_id_);
        }

        // 2. One handshake per unordered pair, in registration order
        HandshakeCoordinator coordinator(session_id_, clock_);
        for (size_t i = 0; i < agents_.size(); ++i) {
            for (size_t j = i + 1; j < agents_.size(); ++j) {
                handshakes_.push_back(coordinator.perform(*agents_[i], *agents_[j]));
                report("  [handshake] " + agents_[i]->name() + " <-> " + agents_[j]->name() + " co-signed");
            }
        }
    } catch (...) {
        state_ = SessionState::FAILED;
        throw;
    }

    state_ = SessionState::STARTED;

    report("Session started: " + session_id_);
    report("  Agents    : " + join(agent_names(), ", "));
    report("  Handshakes: " + std::to_string(handshakes_.size()) + " co-signed");
    report("  Timestamp : " + std::to_string(*started_at_));

    return *this;
}

Event SessionCoordinator::stamp(const std::string& agent_name,
                                const std::string& event_type,
                                const nlohmann::json& payload,
                                const std::optional<std::string>& peer) {
    require_state(SessionState::STARTED, "stamp");

    // Resolve everything before any chain is touched
    IdentityMember& agent = *find_agent(agent_name);
    IdentityMember* peer_agent = peer ? find_agent(*peer) : nullptr;
    if (peer_agent == &agent) {
        throw InvalidArgument("Agent '" + agent_name + "' cannot co-sign an interaction with itself.");
    }
    nlohmann::json safe_payload = redact_payload(payload);

    if (!peer_agent) {
        // Unilateral action
        return agent.stamp(event_type, safe_payload, session_id_);
    }

    // Shared by both logs, byte for byte
    const auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(clock_().time_since_epoch()).count();
    const std::string interaction_hash =
        ContentDigest::digest(agent.agent_id() + ":" + peer_agent->agent_id() + ":" + std::to_string(ns));

    Event event_agent = agent.stamp(
        event_type,
        build_event_payload(safe_payload, {{"interaction_hash", interaction_hash}, {"my_role", "initiator"}}),
        session_id_,
        peer_agent->agent_id());

    try {
        peer_agent->stamp(
            event_type + "_received",
            build_event_payload(safe_payload, {{"interaction_hash", interaction_hash}, {"my_role", "responder"}}),
            session_id_,
            agent.agent_id(),
            event_agent.signature);
    } catch (...) {
        // The initiator's side is already in its log and cannot be unwritten.
        state_ = SessionState::FAILED;
        throw;
    }

    return event_agent;
}

SessionSummary SessionCoordinator::end() {
    require_state(SessionState::STARTED, "end");

    const int64_t ended_at = unix_seconds(clock_());
    const int64_t duration = ended_at - started_at_.value_or(ended_at);
    const size_t events_before_end = total_events();

    try {
        for (auto& agent : agents_) {
            agent->stamp("session_end",
                         {
                             {"session_id", session_id_},
                             {"duration_seconds", duration},
                             {"total_events", events_before_end},
                         },
                         session_id_);
        }
    } catch (...) {
        state_ = SessionState::FAILED;
        throw;
    }

    state_ = SessionState::ENDED;

    report("Session ended: " + session_id_);
    report("  Duration : " + std::to_string(duration) + "s");
    report("  Events   : " + std::to_string(events_before_end));

    return summary();
}

SessionSummary SessionCoordinator::summary() const {
    SessionSummary s;
    s.session_id = session_id_;
    s.started_at = started_at_;
    for (const auto& agent : agents_) {
        s.agents.push_back(AgentSummary{agent->name(), agent->agent_id(), agent->event_count(), agent->chain_head()});
    }
    s.handshakes = handshakes_;
    s.handshake_count = handshakes_.size();
    s.total_events = total_events();
    return s;
}

nlohmann::json SessionCoordinator::export_json() const {
    if (state_ != SessionState::STARTED && state_ != SessionState::ENDED) {
        throw StateError("Session " + session_id_ + " is " + to_string(state_) + "; start it before exporting.");
    }

    nlohmann::json agents_json = nlohmann::json::object();
    for (const auto& agent : agents_) {
        nlohmann::json events = nlohmann::json::array();
        for (const auto& event : agent->events()) {
            events.push_back(event.to_json());
        }
        agents_json[agent->name()] = {
            {"agent_id", agent->agent_id()},
            {"public_key", Crypto::to_hex(agent->public_key().data)},
            {"event_count", agent->event_count()},
            {"events", events},
        };
    }

    return {
        {"session", summary().to_json()},
        {"agents", agents_json},
    };
}

void SessionCoordinator::export_audit(std::ostream& out) const {
    out << export_json().dump(2) << '\n';
}

std::string SessionCoordinator::export_audit(const std::string& output_path) const {
    nlohmann::json doc = export_json();

    std::ofstream out(output_path, std::ios::trunc);
    if (!out) {
        throw PersistenceError("Cannot open export file: " + output_path);
    }
    out << doc.dump(2) << '\n';
    if (!out) {
        throw PersistenceError("Failed to write export file: " + output_path);
    }

    report("Audit exported: " + output_path);
    return output_path;
}

const std::string& SessionCoordinator::id() const {
    return session_id_;
}

SessionState SessionCoordinator::state() const {
    return state_;
}

const IdentityMember& SessionCoordinator::get_agent(const std::string& name) const {
    return *find_agent(name);
}

std::vector<std::string> SessionCoordinator::agent_names() const {
    std::vector<std::string> names;
    for (const auto& agent : agents_) {
        names.push_back(agent->name());
    }
    return names;
}

std::vector<HandshakeResult> SessionCoordinator::handshakes() const {
    return handshakes_;
}

void SessionCoordinator::set_on_progress_callback(ProgressCallback callback) {
    on_progress_callback_ = std::move(callback);
}

nlohmann::json SessionCoordinator::redact_payload(const nlohmann::json& payload) {
    if (!payload.is_object()) {
        throw InvalidArgument("Event payload must be a JSON object.");
    }
    nlohmann::json safe = nlohmann::json::object();
    for (auto it = payload.begin(); it != payload.end(); ++it) {
        const std::string& key = it.key();
        if (ends_with(key, "_hash") || ends_with(key, "_id") || key == "session_id") {
            safe[key] = it.value();
        } else if (payload.contains(key + "_hash")) {
            throw InvalidArgument("Payload field '" + key + "' collides with field '" + key + "_hash'.");
        } else {
            safe[key + "_hash"] = ContentDigest::digest(it.value());
        }
    }
    if (!is_serializable(safe)) {
        throw InvalidArgument("Event payload contains strings that are not valid UTF-8.");
    }
    return safe;
}

// --- private ---

IdentityMember* SessionCoordinator::find_agent(const std::string& name) const {
    for (const auto& agent : agents_) {
        if (agent->name() == name) {
            return agent.get();
        }
    }
    throw LookupError("Agent '" + name + "' not in session. Available: " + join(agent_names(), ", "));
}

void SessionCoordinator::require_state(SessionState required, const char* operation) const {
    if (state_ != required) {
        throw StateError(std::string("Cannot ") + operation + " session " + session_id_ + ": state is " +
                         to_string(state_) + ", expected " + to_string(required) + ".");
    }
}

size_t SessionCoordinator::total_events() const {
    size_t total = 0;
    for (const auto& agent : agents_) {
        total += agent->event_count();
    }
    return total;
}

void SessionCoordinator::report(const std::string& message) const {
    if (on_progress_callback_) {
        on_progress_callback_(message);
    }
}

} // namespace Concord
