#ifndef CONCORD_CONFIG_HPP
#define CONCORD_CONFIG_HPP

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "event_store.hpp"
#include "identity.hpp"

namespace Concord {

    using Clock = std::function<std::chrono::system_clock::time_point()>;
    using SessionIdGenerator = std::function<std::string()>;
    using ProgressCallback = std::function<void(const std::string&)>;

    Clock system_clock();
    int64_t unix_seconds(std::chrono::system_clock::time_point tp);

    /**
     * @brief Default session id: "sess_" followed by 16 random hex characters.
     */
    std::string generate_session_id();

    // One participant: its session-scoped name and where its identity is loaded from.
    struct AgentDefinition {
        std::string name;
        IdentitySource identity;
    };

    /**
     * @brief Collaborators a session is built with. Empty members fall back to
     * an in-memory event store, generate_session_id() and the system clock.
     */
    struct SessionOptions {
        std::shared_ptr<EventStore> store;
        SessionIdGenerator session_id_generator;
        Clock clock;
    };

    /**
     * @brief Session setup read from a JSON file:
     *
     *   {
     *     "agents": [{"name": "llm", "identity_file": "llm.json"}, ...],
     *     "store_directory": "events",        (optional)
     *     "export_path": "session-audit.json" (optional)
     *   }
     *
     * Relative identity_file and store_directory paths are resolved against the
     * directory that holds the config file.
     */
    struct SessionConfig {
        std::vector<AgentDefinition> agents;
        std::string store_directory;
        std::string export_path = "session-audit.json";

        /**
         * @throws Concord::ConfigurationError if the file is missing or malformed.
         */
        static SessionConfig load(const std::string& path);

        /**
         * @brief Options matching this config: a FileEventStore when store_directory is set.
         */
        SessionOptions options() const;
    };

} // namespace Concord

#endif // CONCORD_CONFIG_HPP
