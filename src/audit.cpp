#include "concord/audit.hpp"

#include <fstream>
#include <map>

#include "concord/crypto.hpp"
#include "concord/errors.hpp"
#include "concord/handshake_messages.hpp"
#include "concord/identity.hpp"
#include "concord/session.hpp"

namespace Concord {

namespace {

struct AgentLog {
    std::string name;
    std::string agent_id;
    PublicKey public_key;
    std::vector<Event> events;
    std::vector<std::string> hashes;
};

const Event* find_by_hash(const AgentLog& log, const std::string& hash) {
    for (size_t i = 0; i < log.hashes.size(); ++i) {
        if (log.hashes[i] == hash) {
            return &log.events[i];
        }
    }
    return nullptr;
}

std::string payload_string(const Event& event, const char* key) {
    auto it = event.payload.find(key);
    if (it == event.payload.end() || !it->is_string()) {
        return {};
    }
    return it->get<std::string>();
}

void check_handshake(const HandshakeResult& record,
                     const std::map<std::string, AgentLog>& logs,
                     AuditReport& report) {
    const std::string label = "handshake " + record.agent_a + " <-> " + record.agent_b;
    auto a = logs.find(record.agent_a);
    auto b = logs.find(record.agent_b);
    if (a == logs.end() || b == logs.end()) {
        report.issues.push_back(label + ": agent missing from export");
        return;
    }

    const Event* event_a = find_by_hash(a->second, record.event_a_hash);
    const Event* event_b = find_by_hash(b->second, record.event_b_hash);
    if (!event_a || !event_b) {
        report.issues.push_back(label + ": co-signed event not found in both logs");
        return;
    }
    if (event_a->event_type() != HANDSHAKE_EVENT_TYPE || event_b->event_type() != HANDSHAKE_EVENT_TYPE) {
        report.issues.push_back(label + ": referenced events are not handshake events");
        return;
    }
    if (event_a->payload.value("proposal", nlohmann::json()) != event_b->payload.value("proposal", nlohmann::json()) ||
        event_a->payload.value("response", nlohmann::json()) != event_b->payload.value("response", nlohmann::json())) {
        report.issues.push_back(label + ": logs disagree on the proposal/response pair");
        return;
    }
    if (payload_string(*event_a, "session_id") != record.session_id ||
        payload_string(*event_b, "session_id") != record.session_id) {
        report.issues.push_back(label + ": session id mismatch");
    }
    if (payload_string(*event_a, "peer_agent_id") != b->second.agent_id ||
        payload_string(*event_b, "peer_agent_id") != a->second.agent_id) {
        report.issues.push_back(label + ": events do not reference each other's agent id");
    }

    try {
        auto proposal = IdentityProposal::from_json(event_a->payload.at("proposal"));
        auto response = IdentityResponse::from_json(event_a->payload.at("response"));
        if (!proposal.verify() || !response.verify() || !response.answers(proposal)) {
            report.issues.push_back(label + ": proposal/response signatures do not verify");
        } else if (proposal.agent_id != a->second.agent_id || response.agent_id != b->second.agent_id) {
            report.issues.push_back(label + ": proposal/response issued by the wrong agents");
        }
    } catch (const InvalidArgument& e) {
        report.issues.push_back(label + ": " + e.what());
    }
    ++report.handshakes_checked;
}

void check_interactions(const std::map<std::string, AgentLog>& logs, AuditReport& report) {
    std::map<std::string, const AgentLog*> by_id;
    for (const auto& [name, log] : logs) {
        by_id[log.agent_id] = &log;
    }

    for (const auto& [name, log] : logs) {
        for (const auto& event : log.events) {
            if (payload_string(event, "my_role") != "responder" || !event.payload.contains("interaction_hash")) {
                continue;
            }
            const std::string label = name + " " + event.event_type();
            auto initiator = by_id.find(payload_string(event, "peer_agent_id"));
            if (initiator == by_id.end()) {
                report.issues.push_back(label + ": initiator not part of the session");
                continue;
            }

            // Interactions stamped at the same clock reading share a hash; the signature tells them apart.
            const std::string peer_signature = payload_string(event, "peer_signature");
            const Event* match = nullptr;
            bool hash_seen = false;
            for (const auto& candidate : initiator->second->events) {
                if (payload_string(candidate, "my_role") != "initiator" ||
                    candidate.payload.value("interaction_hash", nlohmann::json()) != event.payload.at("interaction_hash")) {
                    continue;
                }
                hash_seen = true;
                if (candidate.signature == peer_signature) {
                    match = &candidate;
                    break;
                }
            }
            if (!match) {
                report.issues.push_back(label + (hash_seen ? ": peer_signature differs from the initiator's signature"
                                                           : ": no matching initiator event"));
                continue;
            }
            if (match->event_type() + "_received" != event.event_type()) {
                report.issues.push_back(label + ": event type does not mirror " + match->event_type());
            }
            if (payload_string(*match, "peer_agent_id") != log.agent_id) {
                report.issues.push_back(label + ": initiator event names a different peer");
            }
            ++report.interactions_checked;
        }
    }
}

} // namespace

void AuditReport::merge(const AuditReport& other) {
    issues.insert(issues.end(), other.issues.begin(), other.issues.end());
    events_checked += other.events_checked;
    handshakes_checked += other.handshakes_checked;
    interactions_checked += other.interactions_checked;
}

AuditReport AuditVerifier::verify_chain(const std::vector<Event>& events,
                                        const PublicKey& public_key,
                                        const std::string& label) {
    AuditReport report;
    const std::string expected_id = derive_agent_id(public_key);
    std::string expected_previous = GENESIS_HASH;

    for (size_t i = 0; i < events.size(); ++i) {
        const Event& event = events[i];
        const std::string where = label + "[" + std::to_string(i) + "]";
        if (event.previous_hash != expected_previous) {
            report.issues.push_back(where + ": previous_hash does not link to the preceding event");
        }
        if (event.agent_id != expected_id) {
            report.issues.push_back(where + ": issued by " + event.agent_id + ", expected " + expected_id);
        }
        if (!event.verify(public_key)) {
            report.issues.push_back(where + ": invalid signature");
        }
        expected_previous = event.hash();
        ++report.events_checked;
    }
    return report;
}

AuditReport AuditVerifier::verify_export(const nlohmann::json& document) {
    AuditReport report;
    if (!document.is_object() || !document.contains("session") || !document.contains("agents") ||
        !document["agents"].is_object()) {
        report.issues.push_back("export: missing 'session' or 'agents'");
        return report;
    }

    SessionSummary summary;
    try {
        summary = SessionSummary::from_json(document["session"]);
    } catch (const InvalidArgument& e) {
        report.issues.push_back(std::string("export: ") + e.what());
        return report;
    }

    // 1. Every agent chain on its own
    std::map<std::string, AgentLog> logs;
    size_t total_events = 0;
    const nlohmann::json& agents = document["agents"];
    for (auto entry = agents.begin(); entry != agents.end(); ++entry) {
        const std::string& name = entry.key();
        const nlohmann::json& agent = entry.value();
        AgentLog log;
        log.name = name;
        try {
            log.agent_id = agent.at("agent_id").get<std::string>();
            log.public_key.data = Crypto::from_hex(agent.at("public_key").get<std::string>());
            for (const auto& e : agent.at("events")) {
                log.events.push_back(Event::from_json(e));
                log.hashes.push_back(log.events.back().hash());
            }
            if (agent.at("event_count").get<size_t>() != log.events.size()) {
                report.issues.push_back(name + ": event_count does not match the number of events");
            }
        } catch (const nlohmann::json::exception& e) {
            report.issues.push_back(name + ": malformed agent entry: " + e.what());
            continue;
        } catch (const InvalidArgument& e) {
            report.issues.push_back(name + ": malformed agent entry: " + e.what());
            continue;
        }

        if (derive_agent_id(log.public_key) != log.agent_id) {
            report.issues.push_back(name + ": agent_id does not match the exported public key");
        }
        report.merge(verify_chain(log.events, log.public_key, name));
        for (size_t i = 0; i < log.events.size(); ++i) {
            if (payload_string(log.events[i], "session_id") != summary.session_id) {
                report.issues.push_back(name + "[" + std::to_string(i) + "]: event belongs to another session");
            }
        }
        total_events += log.events.size();
        logs.emplace(name, std::move(log));
    }

    // 2. Summary against the logs
    for (const auto& agent : summary.agents) {
        auto it = logs.find(agent.name);
        if (it == logs.end()) {
            report.issues.push_back("summary: agent " + agent.name + " has no log");
            continue;
        }
        const AgentLog& log = it->second;
        const std::string last_hash = log.hashes.empty() ? std::string(GENESIS_HASH) : log.hashes.back();
        if (agent.agent_id != log.agent_id || agent.event_count != log.events.size() || agent.last_hash != last_hash) {
            report.issues.push_back("summary: agent " + agent.name + " does not match its log");
        }
    }
    if (summary.total_events != total_events) {
        report.issues.push_back("summary: total_events does not match the logs");
    }
    if (summary.handshake_count != summary.handshakes.size()) {
        report.issues.push_back("summary: handshake_count does not match the handshake records");
    }

    // 3. Cross-log facts
    for (const auto& record : summary.handshakes) {
        check_handshake(record, logs, report);
    }
    check_interactions(logs, report);

    return report;
}

AuditReport AuditVerifier::verify_export_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw PersistenceError("Cannot open export file: " + path);
    }
    nlohmann::json document;
    try {
        in >> document;
    } catch (const nlohmann::json::parse_error& e) {
        throw PersistenceError("Export file " + path + " is not valid JSON: " + e.what());
    }
    return verify_export(document);
}

} // namespace Concord
