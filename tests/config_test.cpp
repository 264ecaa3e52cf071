#include "concord/config.hpp"

#include <gtest/gtest.h>

#include <fstream>

#include "concord/crypto.hpp"
#include "concord/errors.hpp"
#include "concord/session.hpp"
#include "test_support.hpp"

TEST(ConfigTest, SessionIdFormat) {
    ASSERT_EQ(Concord::Crypto::init(), 0);

    auto id = Concord::generate_session_id();

    EXPECT_EQ(id.rfind("sess_", 0), 0u);
    EXPECT_EQ(id.size(), 21u);
    EXPECT_EQ(id.find_first_not_of("0123456789abcdef", 5), std::string::npos);
    EXPECT_NE(id, Concord::generate_session_id());
}

TEST(ConfigTest, UnixSeconds) {
    EXPECT_EQ(Concord::unix_seconds(ConcordTest::fixed_clock(1700000000)()), 1700000000);
}

TEST(ConfigTest, LoadSessionConfig) {
    ASSERT_EQ(Concord::Crypto::init(), 0);
    ConcordTest::TempDir dir("concord_config");

    auto llm = Concord::Identity::generate();
    auto trading = Concord::Identity::generate();
    Concord::save_identity_file(llm, (dir.path() / "llm.json").string());
    Concord::save_identity_file(trading, (dir.path() / "trading.json").string());

    const auto config_path = dir.path() / "session.json";
    std::ofstream(config_path) << R"({
        "agents": [
            {"name": "llm", "identity_file": "llm.json"},
            {"name": "trading", "identity_file": "trading.json"}
        ],
        "store_directory": "events",
        "export_path": "out.json"
    })";

    auto config = Concord::SessionConfig::load(config_path.string());

    ASSERT_EQ(config.agents.size(), 2u);
    EXPECT_EQ(config.agents[0].name, "llm");
    EXPECT_EQ(config.agents[0].identity.load().agent_id, llm.agent_id);
    EXPECT_EQ(config.agents[1].identity.load().agent_id, trading.agent_id);
    EXPECT_EQ(config.store_directory, (dir.path() / "events").string());
    EXPECT_EQ(config.export_path, "out.json");

    // A session built from the config writes its events to the store directory
    Concord::SessionCoordinator session(config.agents, config.options());
    session.set_on_progress_callback(nullptr);
    session.start();

    Concord::FileEventStore store(config.store_directory);
    EXPECT_EQ(store.load(llm.agent_id).size(), session.get_agent("llm").event_count());
    EXPECT_EQ(store.load(trading.agent_id).back().hash(), session.get_agent("trading").chain_head());
}

TEST(ConfigTest, DefaultsWithoutOptionalFields) {
    ASSERT_EQ(Concord::Crypto::init(), 0);
    ConcordTest::TempDir dir("concord_config");

    const auto config_path = dir.path() / "session.json";
    std::ofstream(config_path) << R"({"agents": [{"name": "a", "identity_file": "/nowhere/a.json"}]})";

    auto config = Concord::SessionConfig::load(config_path.string());

    EXPECT_TRUE(config.store_directory.empty());
    EXPECT_EQ(config.export_path, "session-audit.json");
    EXPECT_EQ(config.agents[0].identity.describe(), "/nowhere/a.json");
    EXPECT_FALSE(config.options().store);
}

TEST(ConfigTest, InvalidConfigs) {
    ConcordTest::TempDir dir("concord_config");

    EXPECT_THROW(Concord::SessionConfig::load((dir.path() / "missing.json").string()), Concord::ConfigurationError);

    const auto not_json = dir.path() / "broken.json";
    std::ofstream(not_json) << "agents:";
    EXPECT_THROW(Concord::SessionConfig::load(not_json.string()), Concord::ConfigurationError);

    const auto no_agents = dir.path() / "empty.json";
    std::ofstream(no_agents) << R"({"store_directory": "x"})";
    EXPECT_THROW(Concord::SessionConfig::load(no_agents.string()), Concord::ConfigurationError);

    const auto no_file = dir.path() / "nofile.json";
    std::ofstream(no_file) << R"({"agents": [{"name": "a"}]})";
    EXPECT_THROW(Concord::SessionConfig::load(no_file.string()), Concord::ConfigurationError);
}

TEST(ConfigTest, UnloadableIdentityFailsConstruction) {
    ASSERT_EQ(Concord::Crypto::init(), 0);
    std::vector<Concord::AgentDefinition> agents = ConcordTest::make_agents({"a"});
    agents.push_back({"b", Concord::IdentitySource::from_file("/nowhere/b.json")});

    EXPECT_THROW(Concord::SessionCoordinator session(agents), Concord::ConfigurationError);
}
