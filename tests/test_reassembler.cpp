#include <gtest/gtest.h>
#include <algorithm>
#include <random>
#include <string>
#include "fragmenter.hpp"
#include "protocol/errors.hpp"
#include "reassembler.hpp"
#include "serializer.hpp"

namespace {

using reassembly::Clock;
using reassembly::ReassemblyState;
using std::chrono::milliseconds;

std::vector<protocol::Fragment> split(const protocol::Payload& payload, size_t chunk_size) {
    fragmenter::Fragmenter fragments(payload, chunk_size);
    std::vector<protocol::Fragment> out;
    while (fragments.has_next()) {
        out.push_back(fragments.next());
    }
    return out;
}

protocol::Payload bytes(const std::string& text) {
    return protocol::Payload(text.begin(), text.end());
}

class ReassemblerTest : public ::testing::Test {
protected:
    Clock::time_point t0 = Clock::time_point{} + std::chrono::hours(1);
    reassembly::Reassembler reassembler{milliseconds(2000)};
};

TEST_F(ReassemblerTest, StartsIdle) {
    EXPECT_EQ(reassembler.state(), ReassemblyState::IDLE);
    EXPECT_EQ(reassembler.expected_total(), 0);
}

TEST_F(ReassemblerTest, InOrderDelivery) {
    protocol::Payload payload = bytes("the quick brown fox jumps over the lazy dog");
    auto fragments = split(payload, 8);
    ASSERT_EQ(fragments.size(), 6u);

    for (size_t i = 0; i + 1 < fragments.size(); ++i) {
        EXPECT_FALSE(reassembler.collect(fragments[i], t0).has_value());
        EXPECT_EQ(reassembler.state(), ReassemblyState::COLLECTING);
        EXPECT_EQ(reassembler.expected_total(), 6);
        EXPECT_EQ(reassembler.received_count(), i + 1);
    }
    auto result = reassembler.collect(fragments.back(), t0);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, payload);
    EXPECT_EQ(reassembler.state(), ReassemblyState::COMPLETE);
    EXPECT_EQ(reassembler.stats().messages_completed, 1u);
}

TEST_F(ReassemblerTest, SingleFragmentMessageCompletesImmediately) {
    protocol::Payload payload = bytes("tiny");
    auto fragments = split(payload, 16);
    ASSERT_EQ(fragments.size(), 1u);
    auto result = reassembler.collect(fragments[0], t0);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, payload);
}

TEST_F(ReassemblerTest, AnyPermutationGivesSamePayload) {
    protocol::Payload payload = bytes("0123456789abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ");
    auto fragments = split(payload, 5);
    std::mt19937 gen(42);

    for (int round = 0; round < 50; ++round) {
        std::shuffle(fragments.begin(), fragments.end(), gen);
        reassembly::Reassembler fresh(milliseconds(2000));
        std::optional<protocol::Payload> result;
        for (const auto& fragment : fragments) {
            ASSERT_FALSE(result.has_value());
            result = fresh.collect(fragment, t0);
        }
        ASSERT_TRUE(result.has_value());
        EXPECT_EQ(*result, payload);
    }
}

TEST_F(ReassemblerTest, DuplicatesDoNotChangeOutcome) {
    protocol::Payload payload = bytes("duplicate fragments are harmless");
    auto fragments = split(payload, 4);

    EXPECT_FALSE(reassembler.collect(fragments[0], t0).has_value());
    EXPECT_FALSE(reassembler.collect(fragments[0], t0).has_value());
    EXPECT_FALSE(reassembler.collect(fragments[3], t0).has_value());
    EXPECT_FALSE(reassembler.collect(fragments[3], t0).has_value());
    EXPECT_EQ(reassembler.received_count(), 2u);

    std::optional<protocol::Payload> result;
    for (size_t i = 1; i < fragments.size(); ++i) {
        if (i == 3) continue;
        result = reassembler.collect(fragments[i], t0);
    }
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, payload);
}

TEST_F(ReassemblerTest, DuplicateOverwritesWithNewerBody) {
    auto fragments = split(bytes("aaaabbbb"), 4);
    protocol::Fragment newer = fragments[0];
    newer.body = bytes("cccc");

    reassembler.collect(fragments[0], t0);
    reassembler.collect(newer, t0);
    auto result = reassembler.collect(fragments[1], t0);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, bytes("ccccbbbb"));
}

TEST_F(ReassemblerTest, ExpiresAfterInactivity) {
    protocol::Payload payload = bytes("this message loses its last fragment");
    auto fragments = split(payload, 6);
    for (size_t i = 0; i + 1 < fragments.size(); ++i) {
        reassembler.collect(fragments[i], t0);
    }

    EXPECT_FALSE(reassembler.expire(t0 + milliseconds(2000)));
    EXPECT_EQ(reassembler.state(), ReassemblyState::COLLECTING);

    EXPECT_TRUE(reassembler.expire(t0 + milliseconds(2001)));
    EXPECT_EQ(reassembler.state(), ReassemblyState::IDLE);
    EXPECT_FALSE(reassembler.collecting());
    EXPECT_EQ(reassembler.received_count(), 0u);
    EXPECT_EQ(reassembler.stats().messages_expired, 1u);

    // The late last fragment alone cannot complete anything
    EXPECT_FALSE(reassembler.collect(fragments.back(), t0 + milliseconds(2500)).has_value());
    EXPECT_EQ(reassembler.received_count(), 1u);
}

TEST_F(ReassemblerTest, AcceptsFreshMessageAfterExpiry) {
    auto stale = split(bytes("stale stale stale"), 4);
    for (size_t i = 0; i + 1 < stale.size(); ++i) {
        reassembler.collect(stale[i], t0);
    }

    // Same total as the stale message; expiry is checked on arrival
    protocol::Payload fresh_payload = bytes("fresh fresh fresh");
    auto fresh = split(fresh_payload, 4);
    ASSERT_EQ(fresh.size(), stale.size());

    auto later = t0 + milliseconds(5000);
    std::optional<protocol::Payload> result;
    for (const auto& fragment : fresh) {
        result = reassembler.collect(fragment, later);
    }
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, fresh_payload);
    EXPECT_EQ(reassembler.stats().messages_expired, 1u);
}

TEST_F(ReassemblerTest, ActivityKeepsMessageAlive) {
    protocol::Payload payload = bytes("slow but steady wins");
    auto fragments = split(payload, 4);
    std::optional<protocol::Payload> result;
    for (size_t i = 0; i < fragments.size(); ++i) {
        result = reassembler.collect(fragments[i], t0 + milliseconds(1500 * i));
    }
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, payload);
}

TEST_F(ReassemblerTest, TotalMismatchStartsNewMessage) {
    auto first = split(bytes("first message, three parts"), 10);
    ASSERT_EQ(first.size(), 3u);
    reassembler.collect(first[0], t0);
    reassembler.collect(first[1], t0);

    protocol::Payload second_payload = bytes("second one");
    auto second = split(second_payload, 5);
    ASSERT_EQ(second.size(), 2u);

    EXPECT_FALSE(reassembler.collect(second[1], t0).has_value());
    EXPECT_EQ(reassembler.expected_total(), 2);
    EXPECT_EQ(reassembler.received_count(), 1u);
    EXPECT_EQ(reassembler.stats().messages_replaced, 1u);

    auto result = reassembler.collect(second[0], t0);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, second_payload);
}

TEST_F(ReassemblerTest, DropsInvalidHeaders) {
    protocol::Fragment zero_total{{0, 0}, bytes("x")};
    protocol::Fragment index_past_total{{3, 3}, bytes("x")};
    EXPECT_FALSE(reassembler.collect(zero_total, t0).has_value());
    EXPECT_FALSE(reassembler.collect(index_past_total, t0).has_value());
    EXPECT_EQ(reassembler.state(), ReassemblyState::IDLE);
    EXPECT_EQ(reassembler.stats().fragments_dropped, 2u);
}

TEST_F(ReassemblerTest, IgnoresForeignDatagramsMidMessage) {
    protocol::Payload payload = bytes("stray traffic is ignored");
    auto fragments = split(payload, 8);
    auto first = protocol::encode_fragment(fragments[0]);
    reassembler.collect_datagram(first.data(), first.size(), t0);

    std::vector<uint8_t> stray = {'H', 'T', 'T', 'P', '/', '1', '.', '1', ' ', '2'};
    std::vector<uint8_t> wrong_version = protocol::encode_fragment(fragments[1]);
    wrong_version[3] = 0x02;
    std::vector<uint8_t> short_datagram(first.begin(), first.begin() + 5);

    EXPECT_FALSE(reassembler.collect_datagram(stray.data(), stray.size(), t0).has_value());
    EXPECT_FALSE(reassembler.collect_datagram(wrong_version.data(), wrong_version.size(), t0).has_value());
    EXPECT_FALSE(reassembler.collect_datagram(short_datagram.data(), short_datagram.size(), t0).has_value());
    EXPECT_EQ(reassembler.state(), ReassemblyState::COLLECTING);
    EXPECT_EQ(reassembler.received_count(), 1u);
    EXPECT_EQ(reassembler.stats().fragments_dropped, 3u);

    std::optional<protocol::Payload> result;
    for (size_t i = 1; i < fragments.size(); ++i) {
        auto datagram = protocol::encode_fragment(fragments[i]);
        result = reassembler.collect_datagram(datagram.data(), datagram.size(), t0);
    }
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, payload);
}

TEST_F(ReassemblerTest, AcceptDeserializesMesh) {
    protocol::Mesh quad = protocol::make_demo_quad();
    auto fragments = split(serializer::serialize(quad, 99.0), 16);
    std::reverse(fragments.begin(), fragments.end());

    std::optional<protocol::MeshMessage> message;
    for (const auto& fragment : fragments) {
        message = reassembler.accept(fragment, t0);
    }
    ASSERT_TRUE(message.has_value());
    EXPECT_EQ(message->mesh, quad);
    EXPECT_EQ(message->captured_at, 99.0);
}

TEST_F(ReassemblerTest, MalformedPayloadReportedThenRecovers) {
    auto garbage = split(bytes("{\"type\":\"mesh\",\"vertices\":[1,2"), 8);
    for (size_t i = 0; i + 1 < garbage.size(); ++i) {
        EXPECT_FALSE(reassembler.accept(garbage[i], t0).has_value());
    }
    EXPECT_THROW(reassembler.accept(garbage.back(), t0), protocol::MalformedPayloadError);
    EXPECT_EQ(reassembler.state(), ReassemblyState::IDLE);
    EXPECT_EQ(reassembler.stats().messages_malformed, 1u);

    protocol::Mesh quad = protocol::make_demo_quad();
    std::optional<protocol::MeshMessage> message;
    for (const auto& fragment : split(serializer::serialize(quad, 1.0), 16)) {
        message = reassembler.accept(fragment, t0);
    }
    ASSERT_TRUE(message.has_value());
    EXPECT_EQ(message->mesh, quad);
}

// ─── SessionTable ───────────────────────────────────────────────────────────

TEST(SessionTable, KeepsSendersApart) {
    auto t0 = Clock::time_point{} + std::chrono::hours(1);
    reassembly::SessionTable sessions(milliseconds(2000));

    protocol::Mesh quad = protocol::make_demo_quad();
    protocol::Mesh merged = protocol::merge({quad, quad});
    auto a = split(serializer::serialize(quad, 1.0), 16);
    auto b = split(serializer::serialize(merged, 2.0), 16);
    ASSERT_NE(a.size(), b.size());

    std::optional<protocol::MeshMessage> from_a, from_b;
    size_t longest = std::max(a.size(), b.size());
    for (size_t i = 0; i < longest; ++i) {
        if (i < a.size()) {
            auto datagram = protocol::encode_fragment(a[i]);
            auto result = sessions.accept("10.0.0.1:4000", datagram.data(), datagram.size(), t0);
            if (result) from_a = result;
        }
        if (i < b.size()) {
            auto datagram = protocol::encode_fragment(b[i]);
            auto result = sessions.accept("10.0.0.2:4000", datagram.data(), datagram.size(), t0);
            if (result) from_b = result;
        }
    }
    ASSERT_TRUE(from_a.has_value());
    ASSERT_TRUE(from_b.has_value());
    EXPECT_EQ(from_a->mesh, quad);
    EXPECT_EQ(from_b->mesh, merged);
    EXPECT_EQ(sessions.stats().messages_replaced, 0u);
}

TEST(SessionTable, InvalidDatagramsNeverCreateSessions) {
    reassembly::SessionTable sessions;
    std::vector<uint8_t> noise = {1, 2, 3};
    EXPECT_FALSE(sessions.accept("10.0.0.9:1", noise.data(), noise.size()).has_value());

    // Well-formed magic but an impossible index/total pair
    auto zero_total = protocol::encode_fragment({{0, 0}, bytes("x")});
    auto index_past_total = protocol::encode_fragment({{3, 3}, bytes("x")});
    EXPECT_FALSE(sessions.accept("10.0.0.9:2", zero_total.data(), zero_total.size()).has_value());
    EXPECT_FALSE(sessions.accept("10.0.0.9:3", index_past_total.data(), index_past_total.size()).has_value());

    EXPECT_EQ(sessions.size(), 0u);
    EXPECT_EQ(sessions.stats().fragments_dropped, 3u);
}

TEST(SessionTable, SweepExpiresAndForgets) {
    auto t0 = Clock::time_point{} + std::chrono::hours(1);
    reassembly::SessionTable sessions(milliseconds(2000));

    auto fragments = split(bytes("partial message from a lossy link"), 8);
    auto datagram = protocol::encode_fragment(fragments[0]);
    sessions.accept("10.0.0.3:5000", datagram.data(), datagram.size(), t0);
    ASSERT_NE(sessions.find("10.0.0.3:5000"), nullptr);

    EXPECT_EQ(sessions.sweep(t0 + milliseconds(1000)), 0u);
    EXPECT_EQ(sessions.size(), 1u);

    EXPECT_EQ(sessions.sweep(t0 + milliseconds(3000)), 1u);
    EXPECT_EQ(sessions.size(), 0u);
    EXPECT_EQ(sessions.find("10.0.0.3:5000"), nullptr);

    auto stats = sessions.stats();
    EXPECT_EQ(stats.fragments_accepted, 1u);
    EXPECT_EQ(stats.messages_expired, 1u);
}

TEST(ReassemblyState, Names) {
    EXPECT_STREQ(reassembly::to_string(ReassemblyState::IDLE), "IDLE");
    EXPECT_STREQ(reassembly::to_string(ReassemblyState::EXPIRED), "EXPIRED");
}

} // namespace
