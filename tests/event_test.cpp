#include "concord/event.hpp"

#include <gtest/gtest.h>

#include "concord/crypto.hpp"
#include "concord/errors.hpp"
#include "concord/identity.hpp"
#include "concord/version.hpp"

namespace {

Concord::Event sample_event(const Concord::Identity& identity, const std::string& previous_hash = "genesis") {
    nlohmann::json payload = {{"event_type", "trade_decision"}, {"session_id", "sess_0011223344556677"}};
    return Concord::Event::sign(identity.keys.privateKey, identity.agent_id, payload, previous_hash, 1700000000);
}

} // namespace

TEST(EventTest, SignAndVerify) {
    ASSERT_EQ(Concord::Crypto::init(), 0);
    auto identity = Concord::Identity::generate();

    Concord::Event event = sample_event(identity);

    EXPECT_EQ(event.version, Concord::version_tag(Concord::CURRENT_VERSION));
    EXPECT_EQ(event.agent_id, identity.agent_id);
    EXPECT_EQ(event.previous_hash, "genesis");
    EXPECT_EQ(event.timestamp, 1700000000);
    EXPECT_EQ(event.event_type(), "trade_decision");
    EXPECT_EQ(event.signature.size(), 128u);
    EXPECT_TRUE(event.verify(identity.keys.publicKey));
}

TEST(EventTest, TamperingBreaksSignature) {
    ASSERT_EQ(Concord::Crypto::init(), 0);
    auto identity = Concord::Identity::generate();
    Concord::Event event = sample_event(identity);

    Concord::Event payload_changed = event;
    payload_changed.payload["event_type"] = "trade_cancelled";
    EXPECT_FALSE(payload_changed.verify(identity.keys.publicKey));

    Concord::Event relinked = event;
    relinked.previous_hash = std::string(64, '0');
    EXPECT_FALSE(relinked.verify(identity.keys.publicKey));

    Concord::Event garbage_signature = event;
    garbage_signature.signature = "not-hex";
    EXPECT_FALSE(garbage_signature.verify(identity.keys.publicKey));

    auto stranger = Concord::Identity::generate();
    EXPECT_FALSE(event.verify(stranger.keys.publicKey));
}

TEST(EventTest, HashCoversSignatureAndIsStable) {
    ASSERT_EQ(Concord::Crypto::init(), 0);
    auto identity = Concord::Identity::generate();
    Concord::Event event = sample_event(identity);

    EXPECT_EQ(event.hash().size(), 64u);
    EXPECT_EQ(event.hash(), event.hash());

    Concord::Event resigned = event;
    resigned.signature[0] = resigned.signature[0] == 'a' ? 'b' : 'a';
    EXPECT_NE(resigned.hash(), event.hash());

    // Two events with identical content still differ through their nonce
    Concord::Event twin = sample_event(identity);
    EXPECT_NE(twin.hash(), event.hash());
}

TEST(EventTest, JsonRoundTripPreservesHash) {
    ASSERT_EQ(Concord::Crypto::init(), 0);
    auto identity = Concord::Identity::generate();
    Concord::Event event = sample_event(identity);

    std::string text = event.to_json().dump(2);
    Concord::Event parsed = Concord::Event::from_json(nlohmann::json::parse(text));

    EXPECT_EQ(parsed.hash(), event.hash());
    EXPECT_TRUE(parsed.verify(identity.keys.publicKey));
}

TEST(EventTest, FromJsonRejectsIncompleteEvents) {
    nlohmann::json missing_signature = {
        {"version", "CONCORD-1.0"},
        {"agent_id", "agent_x"},
        {"timestamp", 1},
        {"nonce", "00"},
        {"payload", nlohmann::json::object()},
        {"previous_hash", "genesis"},
    };
    EXPECT_THROW(Concord::Event::from_json(missing_signature), Concord::InvalidArgument);

    nlohmann::json bad_payload = missing_signature;
    bad_payload["signature"] = "00";
    bad_payload["payload"] = "not an object";
    EXPECT_THROW(Concord::Event::from_json(bad_payload), Concord::InvalidArgument);

    EXPECT_THROW(Concord::Event::from_json(nlohmann::json::array()), Concord::InvalidArgument);
}

TEST(EventTest, BuildEventPayloadIsPure) {
    const nlohmann::json base = {{"symbol_hash", "abc"}, {"event_type", "user supplied"}};
    const nlohmann::json extension = {{"event_type", "advice"}, {"session_id", "sess_1"}};

    nlohmann::json merged = Concord::build_event_payload(base, extension);

    EXPECT_EQ(merged["symbol_hash"], "abc");
    EXPECT_EQ(merged["event_type"], "advice");
    EXPECT_EQ(merged["session_id"], "sess_1");

    // Inputs are untouched
    EXPECT_EQ(base.size(), 2u);
    EXPECT_EQ(base.at("event_type"), "user supplied");
    EXPECT_FALSE(base.contains("session_id"));

    EXPECT_THROW(Concord::build_event_payload(nlohmann::json::array(), extension), Concord::InvalidArgument);
}

TEST(EventTest, InvalidUtf8PayloadIsRejected) {
    ASSERT_EQ(Concord::Crypto::init(), 0);
    auto identity = Concord::Identity::generate();

    EXPECT_THROW(Concord::Event::sign(identity.keys.privateKey, identity.agent_id, {{"order_id", "\xff"}}, "genesis", 1),
                 Concord::InvalidArgument);
}
