#include "concord/identity_member.hpp"

#include <gtest/gtest.h>

#include <memory>

#include "concord/audit.hpp"
#include "concord/crypto.hpp"
#include "concord/errors.hpp"
#include "test_support.hpp"

namespace {

std::unique_ptr<Concord::IdentityMember> make_member(const std::string& name,
                                                     std::shared_ptr<Concord::EventStore> store) {
    return std::make_unique<Concord::IdentityMember>(
        name, Concord::Identity::generate(), std::move(store), ConcordTest::fixed_clock(1700000000));
}

} // namespace

TEST(IdentityMemberTest, StampExtendsChain) {
    ASSERT_EQ(Concord::Crypto::init(), 0);
    auto store = std::make_shared<Concord::MemoryEventStore>();
    auto member = make_member("llm", store);

    EXPECT_EQ(member->chain_head(), "genesis");
    EXPECT_EQ(member->event_count(), 0u);

    auto first = member->stamp("recommendation", {{"symbol_hash", "abc"}}, "sess_test");
    auto second = member->stamp("recommendation", {{"symbol_hash", "def"}}, "sess_test");

    EXPECT_EQ(first.previous_hash, "genesis");
    EXPECT_EQ(second.previous_hash, first.hash());
    EXPECT_EQ(member->chain_head(), second.hash());
    EXPECT_EQ(member->event_count(), 2u);
    EXPECT_EQ(store->events().size(), 2u);

    EXPECT_EQ(first.payload["event_type"], "recommendation");
    EXPECT_EQ(first.payload["session_id"], "sess_test");
    EXPECT_EQ(first.payload["protocol_version"], "CONCORD-1.0");
    EXPECT_EQ(first.timestamp, 1700000000);
    EXPECT_FALSE(first.payload.contains("peer_agent_id"));

    EXPECT_TRUE(Concord::AuditVerifier::verify_chain(member->events(), member->public_key()).valid());
}

TEST(IdentityMemberTest, StampRecordsPeer) {
    ASSERT_EQ(Concord::Crypto::init(), 0);
    auto member = make_member("llm", std::make_shared<Concord::MemoryEventStore>());

    auto event = member->stamp("advice_received", nlohmann::json::object(), "sess_test", std::string("agent_peer"),
                               std::string("abcd"));

    EXPECT_EQ(event.payload["peer_agent_id"], "agent_peer");
    EXPECT_EQ(event.payload["peer_signature"], "abcd");
}

TEST(IdentityMemberTest, EventsAreACopy) {
    ASSERT_EQ(Concord::Crypto::init(), 0);
    auto member = make_member("llm", std::make_shared<Concord::MemoryEventStore>());
    member->stamp("one", nlohmann::json::object(), "sess_test");

    auto events = member->events();
    events.clear();

    EXPECT_EQ(member->event_count(), 1u);
    EXPECT_EQ(member->events().size(), 1u);
}

TEST(IdentityMemberTest, StoreFailureLeavesChainUnchanged) {
    ASSERT_EQ(Concord::Crypto::init(), 0);
    auto store = std::make_shared<ConcordTest::FailingEventStore>(1);
    auto member = make_member("llm", store);

    auto first = member->stamp("one", nlohmann::json::object(), "sess_test");
    EXPECT_THROW(member->stamp("two", nlohmann::json::object(), "sess_test"), Concord::PersistenceError);

    EXPECT_EQ(member->chain_head(), first.hash());
    EXPECT_EQ(member->event_count(), 1u);

    // Once the store recovers the chain continues from the last persisted event
    store->set_fail_after(10);
    auto second = member->stamp("two", nlohmann::json::object(), "sess_test");
    EXPECT_EQ(second.previous_hash, first.hash());
}

TEST(IdentityMemberTest, HandshakeBetweenMembers) {
    ASSERT_EQ(Concord::Crypto::init(), 0);
    auto store = std::make_shared<Concord::MemoryEventStore>();
    auto llm = make_member("llm", store);
    auto trading = make_member("trading", store);

    auto proposal = llm->propose(Concord::SESSION_CAPABILITIES, {{"name", "llm"}});
    auto response = trading->respond(proposal, Concord::SESSION_CAPABILITIES);
    auto event_a = llm->stamp_handshake(proposal, response, {{"session_id", "sess_test"}});
    auto event_b = trading->stamp_handshake(proposal, response, {{"session_id", "sess_test"}});

    EXPECT_EQ(llm->chain_head(), event_a.hash());
    EXPECT_EQ(trading->chain_head(), event_b.hash());
    EXPECT_EQ(event_a.payload["peer_agent_id"], trading->agent_id());
    EXPECT_EQ(event_b.payload["peer_agent_id"], llm->agent_id());
}

TEST(IdentityMemberTest, RequiresStore) {
    ASSERT_EQ(Concord::Crypto::init(), 0);
    EXPECT_THROW(Concord::IdentityMember("llm", Concord::Identity::generate(), nullptr, Concord::system_clock()),
                 Concord::InvalidArgument);
}
