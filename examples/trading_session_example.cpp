#include "concord/session.hpp"
#include "concord/config.hpp"
#include "concord/crypto.hpp"
#include "concord/errors.hpp"
#include <iostream>
#include <string>

// This example runs a three-agent trading session.
// 1. An LLM agent, a trading agent and a risk agent are registered (or loaded from a config file).
// 2. The session starts: every agent stamps session_start and every pair co-signs a handshake.
// 3. The agents stamp unilateral and co-signed events; raw values are stored as hashes.
// 4. The session ends and the full audit trail is exported to JSON.
//
// Usage: trading_session_example [session-config.json]

int main(int argc, char* argv[]) {
    // 1. Initialize the crypto library
    if (Concord::Crypto::init() != 0) {
        std::cerr << "Failed to initialize crypto library!" << std::endl;
        return 1;
    }
    std::cout << "Crypto library initialized." << std::endl;

    try {
        // 2. Agents come from a config file when one is given, otherwise fresh identities
        std::vector<Concord::AgentDefinition> agents;
        Concord::SessionOptions options;
        std::string export_path = "session-audit.json";
        if (argc > 1) {
            auto config = Concord::SessionConfig::load(argv[1]);
            agents = config.agents;
            options = config.options();
            export_path = config.export_path;
            std::cout << "Loaded " << agents.size() << " agents from " << argv[1] << std::endl;
        } else {
            for (const char* name : {"llm", "trading", "risk"}) {
                agents.push_back({name, Concord::IdentitySource::from_identity(Concord::Identity::generate())});
            }
        }

        Concord::SessionCoordinator session(agents, options);

        // 3. Start: session_start events and all pairwise handshakes
        session.start();

        // 4. Interactions
        session.stamp("llm", "recommendation", {{"symbol", "AAPL"}, {"action", "buy"}, {"confidence", 0.87}});
        session.stamp("llm", "advice", {{"symbol", "AAPL"}, {"action", "buy"}}, std::string("trading"));
        session.stamp("risk", "limit_check", {{"symbol", "AAPL"}, {"exposure", 0.12}}, std::string("trading"));
        auto order = session.stamp("trading", "trade_executed", {{"symbol", "AAPL"}, {"quantity", 100}, {"order_id", "ord-0001"}});
        std::cout << "Order event hash: " << order.hash() << std::endl;

        // 5. End and export
        auto summary = session.end();
        std::cout << "\nSummary:\n" << summary.to_json().dump(2) << std::endl;

        session.export_audit(export_path);
    } catch (const Concord::Exception& e) {
        std::cerr << "Session failed: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
