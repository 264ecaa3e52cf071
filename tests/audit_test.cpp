#include "concord/audit.hpp"

#include <gtest/gtest.h>

#include <fstream>

#include "concord/crypto.hpp"
#include "concord/errors.hpp"
#include "concord/session.hpp"
#include "test_support.hpp"

class AuditTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_EQ(Concord::Crypto::init(), 0);
        Concord::SessionOptions options;
        options.clock = ConcordTest::ticking_clock(1700000000);
        session = std::make_unique<Concord::SessionCoordinator>(ConcordTest::make_agents({"llm", "trading", "risk"}),
                                                                options);
        session->set_on_progress_callback(nullptr);
        session->start();
        session->stamp("llm", "recommendation", {{"symbol", "AAPL"}});
        session->stamp("llm", "advice", {{"action", "buy"}}, std::string("trading"));
        session->stamp("risk", "limit_check", {{"exposure", 0.4}}, std::string("trading"));
        session->end();
        document = session->export_json();
    }

    std::unique_ptr<Concord::SessionCoordinator> session;
    nlohmann::json document;
};

TEST_F(AuditTest, ValidExport) {
    auto report = Concord::AuditVerifier::verify_export(document);

    EXPECT_TRUE(report.valid());
    EXPECT_EQ(report.events_checked, session->summary().total_events);
    EXPECT_EQ(report.handshakes_checked, 3u);
    EXPECT_EQ(report.interactions_checked, 2u);
}

TEST_F(AuditTest, TamperedPayloadIsDetected) {
    auto& events = document["agents"]["llm"]["events"];
    events[3]["payload"]["symbol_hash"] = std::string(64, '0');

    auto report = Concord::AuditVerifier::verify_export(document);

    EXPECT_FALSE(report.valid());
}

TEST_F(AuditTest, RemovedEventIsDetected) {
    auto& entry = document["agents"]["trading"];
    entry["events"].erase(1);
    entry["event_count"] = entry["events"].size();

    auto report = Concord::AuditVerifier::verify_export(document);

    EXPECT_FALSE(report.valid());
}

TEST_F(AuditTest, ForgedPeerSignatureIsDetected) {
    auto& events = document["agents"]["trading"]["events"];
    bool found = false;
    for (auto& event : events) {
        if (event["payload"]["event_type"] == "advice_received") {
            event["payload"]["peer_signature"] = std::string(128, 'a');
            found = true;
        }
    }
    ASSERT_TRUE(found);

    auto report = Concord::AuditVerifier::verify_export(document);

    EXPECT_FALSE(report.valid());
}

TEST_F(AuditTest, WrongSessionSummaryIsDetected) {
    document["session"]["total_events"] = 1;
    EXPECT_FALSE(Concord::AuditVerifier::verify_export(document).valid());
}

TEST_F(AuditTest, MalformedDocument) {
    auto report = Concord::AuditVerifier::verify_export(nlohmann::json::array());
    EXPECT_FALSE(report.valid());

    nlohmann::json missing_summary = {{"agents", nlohmann::json::object()}};
    EXPECT_FALSE(Concord::AuditVerifier::verify_export(missing_summary).valid());
}

TEST_F(AuditTest, VerifyExportFile) {
    ConcordTest::TempDir dir("concord_audit");
    const std::string path = (dir.path() / "audit.json").string();
    session->export_audit(path);

    EXPECT_TRUE(Concord::AuditVerifier::verify_export_file(path).valid());
    EXPECT_THROW(Concord::AuditVerifier::verify_export_file((dir.path() / "none.json").string()),
                 Concord::PersistenceError);

    const auto broken = dir.path() / "broken.json";
    std::ofstream(broken) << "{";
    EXPECT_THROW(Concord::AuditVerifier::verify_export_file(broken.string()), Concord::PersistenceError);
}

TEST(AuditChainTest, ChainFromAnotherKeyIsRejected) {
    ASSERT_EQ(Concord::Crypto::init(), 0);
    auto owner = Concord::Identity::generate();
    auto stranger = Concord::Identity::generate();

    auto first = Concord::Event::sign(owner.keys.privateKey, owner.agent_id, {{"event_type", "a"}}, "genesis", 1);
    auto second = Concord::Event::sign(owner.keys.privateKey, owner.agent_id, {{"event_type", "b"}}, first.hash(), 2);

    EXPECT_TRUE(Concord::AuditVerifier::verify_chain({first, second}, owner.keys.publicKey).valid());
    EXPECT_FALSE(Concord::AuditVerifier::verify_chain({first, second}, stranger.keys.publicKey).valid());

    // Out of order
    auto report = Concord::AuditVerifier::verify_chain({second, first}, owner.keys.publicKey);
    EXPECT_FALSE(report.valid());
    EXPECT_EQ(report.events_checked, 2u);
}

TEST(AuditInteractionTest, SameClockReadingInteractionsVerify) {
    ASSERT_EQ(Concord::Crypto::init(), 0);
    Concord::SessionOptions options;
    options.clock = ConcordTest::fixed_clock(1700000000);
    Concord::SessionCoordinator session(ConcordTest::make_agents({"llm", "trading"}), options);
    session.set_on_progress_callback(nullptr);
    session.start();

    auto first = session.stamp("llm", "advice", {{"action", "buy"}}, std::string("trading"));
    auto second = session.stamp("llm", "advice", {{"action", "sell"}}, std::string("trading"));
    ASSERT_EQ(first.payload["interaction_hash"], second.payload["interaction_hash"]);

    auto report = Concord::AuditVerifier::verify_export(session.export_json());

    EXPECT_TRUE(report.valid());
    EXPECT_EQ(report.interactions_checked, 2u);
}
