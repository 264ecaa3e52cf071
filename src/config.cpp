#include "concord/config.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>

#include "concord/crypto.hpp"
#include "concord/errors.hpp"

namespace Concord {

namespace {

constexpr size_t SESSION_ID_BYTES = 8;

std::string resolve(const std::filesystem::path& base, const std::string& path) {
    std::filesystem::path p(path);
    if (p.is_relative()) {
        p = base / p;
    }
    return p.string();
}

} // namespace

Clock system_clock() {
    return []() { return std::chrono::system_clock::now(); };
}

int64_t unix_seconds(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

std::string generate_session_id() {
    return "sess_" + Crypto::random_hex(SESSION_ID_BYTES);
}

SessionConfig SessionConfig::load(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigurationError("Cannot open session config: " + path);
    }

    nlohmann::json j;
    try {
        in >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigurationError("Session config " + path + " is not valid JSON: " + e.what());
    }

    const auto base = std::filesystem::path(path).parent_path();
    SessionConfig config;
    try {
        for (const auto& agent : j.at("agents")) {
            config.agents.push_back(AgentDefinition{
                agent.at("name").get<std::string>(),
                IdentitySource::from_file(resolve(base, agent.at("identity_file").get<std::string>())),
            });
        }
        if (j.contains("store_directory")) {
            config.store_directory = resolve(base, j.at("store_directory").get<std::string>());
        }
        if (j.contains("export_path")) {
            config.export_path = j.at("export_path").get<std::string>();
        }
    } catch (const nlohmann::json::exception& e) {
        throw ConfigurationError("Session config " + path + " is malformed: " + e.what());
    }
    return config;
}

SessionOptions SessionConfig::options() const {
    SessionOptions options;
    if (!store_directory.empty()) {
        options.store = std::make_shared<FileEventStore>(store_directory);
    }
    return options;
}

} // namespace Concord
