/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the PeerRelay project.
 */

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <thread>

#include "../src/Signaling/Registry/PeerRegistry.h"
#include "FakePeerEngine.h"

using namespace PeerRelay::Signaling;
using namespace PeerRelay::Signaling::Testing;

TEST(PeerRegistryTests, AddAndLookup) {
    FakeEngineFactory engines;
    PeerRegistry registry(engines.make(), 8);

    auto added = registry.add("7", NegotiationRole::Responder);
    ASSERT_TRUE(added.success()) << added.errorMessage;
    EXPECT_TRUE(added.value.valid());
    EXPECT_EQ(added.value.peerId(), "7");
    EXPECT_EQ(added.value.role(), NegotiationRole::Responder);
    EXPECT_EQ(added.value.getState(), NegotiationState::Idle);

    EXPECT_TRUE(registry.contains("7"));
    EXPECT_EQ(registry.size(), 1u);
    ASSERT_NE(registry.lookup("7"), nullptr);
    ASSERT_TRUE(registry.get("7").has_value());
    EXPECT_EQ(registry.lookup("missing"), nullptr);
    EXPECT_FALSE(registry.get("missing").has_value());

    // The engine was started by the session, not by the factory
    auto fake = engines.latest("7");
    ASSERT_NE(fake, nullptr);
    EXPECT_EQ(fake->countCalls("start"), 1u);
}

TEST(PeerRegistryTests, DuplicateAddLeavesFirstSessionUntouched) {
    FakeEngineFactory engines;
    PeerRegistry registry(engines.make(), 8);

    auto first = registry.add("7", NegotiationRole::Initiator);
    ASSERT_TRUE(first.success());
    auto firstSession = registry.lookup("7");

    auto second = registry.add("7", NegotiationRole::Responder);
    EXPECT_EQ(second.error, SignalingError::AlreadyExists);

    EXPECT_EQ(registry.size(), 1u);
    EXPECT_EQ(registry.lookup("7"), firstSession);
    EXPECT_EQ(firstSession->role(), NegotiationRole::Initiator);
    EXPECT_FALSE(firstSession->engineReleased());
    EXPECT_EQ(engines.built("7"), 1u);
    EXPECT_EQ(registry.getMetrics().duplicateAdds, 1u);
}

TEST(PeerRegistryTests, RemoveIsIdempotent) {
    FakeEngineFactory engines;
    PeerRegistry registry(engines.make(), 8);

    ASSERT_TRUE(registry.add("7", NegotiationRole::Responder).success());
    auto fake = engines.latest("7");

    registry.remove("7");
    EXPECT_FALSE(registry.contains("7"));
    EXPECT_TRUE(fake->isReleased());

    registry.remove("7");
    registry.remove("never-added");
    EXPECT_EQ(registry.size(), 0u);
    EXPECT_EQ(fake->countCalls("close"), 1u);
    EXPECT_EQ(registry.getMetrics().sessionsRemoved, 1u);
}

TEST(PeerRegistryTests, RegisteredSessionsHoldLiveEngines) {
    FakeEngineFactory engines;
    PeerRegistry registry(engines.make(), 8);

    for (const char* id : {"1", "2", "3", "4"}) {
        ASSERT_TRUE(registry.add(id, NegotiationRole::Responder).success());
    }
    registry.remove("2");

    size_t visited = 0;
    registry.forEach([&visited](const std::shared_ptr<PeerSession>& session) {
        EXPECT_FALSE(session->engineReleased());
        EXPECT_FALSE(session->isTornDown());
        ++visited;
    });
    EXPECT_EQ(visited, 3u);
    EXPECT_TRUE(engines.latest("2")->isReleased());
}

TEST(PeerRegistryTests, HandleGoesStaleAfterRemove) {
    FakeEngineFactory engines;
    PeerRegistry registry(engines.make(), 8);

    auto added = registry.add("7", NegotiationRole::Initiator);
    ASSERT_TRUE(added.success());
    PeerHandle stale = added.value;
    PeerHandle copy = stale;

    copy.remove();
    EXPECT_FALSE(stale.valid());
    EXPECT_FALSE(copy.valid());
    EXPECT_EQ(stale.getState(), NegotiationState::Failed);
    EXPECT_TRUE(stale.peerId().empty());
    EXPECT_EQ(stale.startNegotiation().error, SignalingError::NotFound);

    // Re-registering the id reuses the slot with a new generation
    auto again = registry.add("7", NegotiationRole::Initiator);
    ASSERT_TRUE(again.success());
    EXPECT_TRUE(again.value.valid());
    EXPECT_FALSE(stale.valid());
    EXPECT_EQ(registry.resolve(stale), nullptr);

    // Removing through the stale handle leaves the new session alone
    registry.remove(stale);
    EXPECT_TRUE(registry.contains("7"));
}

TEST(PeerRegistryTests, HandleDrivesNegotiation) {
    FakeEngineFactory engines;
    engines.configure = [](FakeEngineState& state) { state.autoOffer = "OFFER_1"; };
    PeerRegistry registry(engines.make(), 8);

    std::vector<SignalingEvent> outbound;
    registry.setOutboundSink([&outbound](const PeerId& peer, const SignalingEvent& event) {
        EXPECT_EQ(peer, "7");
        outbound.push_back(event);
    });

    auto added = registry.add("7", NegotiationRole::Initiator);
    ASSERT_TRUE(added.success());
    PeerHandle handle = added.value;
    ASSERT_TRUE(handle.startNegotiation().success());
    EXPECT_EQ(handle.getState(), NegotiationState::LocalDescriptionSet);
    ASSERT_TRUE(handle.handleIceCandidate(IceCandidate{0, "c1", std::nullopt}).success());
    ASSERT_TRUE(handle.handleRemoteSdp(SdpKind::Answer, "ANSWER_1").success());
    EXPECT_EQ(handle.getState(), NegotiationState::Stable);

    ASSERT_EQ(outbound.size(), 1u);
    EXPECT_EQ(std::get<SdpMessage>(outbound[0]).sdp, "OFFER_1");
    EXPECT_EQ(engines.latest("7")->countCalls("addIce:c1"), 1u);
}

TEST(PeerRegistryTests, CapacityIsEnforced) {
    FakeEngineFactory engines;
    PeerRegistry registry(engines.make(), 2);

    ASSERT_TRUE(registry.add("a", NegotiationRole::Responder).success());
    ASSERT_TRUE(registry.add("b", NegotiationRole::Responder).success());
    EXPECT_EQ(registry.add("c", NegotiationRole::Responder).error, SignalingError::ResourceLimitExceeded);

    registry.remove("a");
    EXPECT_TRUE(registry.add("c", NegotiationRole::Responder).success());
}

TEST(PeerRegistryTests, EngineConstructionFailureLeavesNoEntry) {
    FakeEngineFactory engines;
    engines.failingPeers.insert("bad");
    PeerRegistry registry(engines.make(), 4);

    auto result = registry.add("bad", NegotiationRole::Responder);
    EXPECT_EQ(result.error, SignalingError::EngineFailure);
    EXPECT_FALSE(registry.contains("bad"));
    EXPECT_EQ(registry.getMetrics().constructionFailures, 1u);

    // The slot went back to the free list
    engines.failingPeers.clear();
    EXPECT_TRUE(registry.add("bad", NegotiationRole::Responder).success());
}

TEST(PeerRegistryTests, EngineStartFailureReleasesEngine) {
    FakeEngineFactory engines;
    engines.configure = [](FakeEngineState& state) { state.startError = "no track"; };
    PeerRegistry registry(engines.make(), 4);

    auto result = registry.add("7", NegotiationRole::Initiator);
    EXPECT_EQ(result.error, SignalingError::EngineFailure);
    EXPECT_FALSE(registry.contains("7"));
    EXPECT_TRUE(engines.latest("7")->isReleased());
}

TEST(PeerRegistryTests, EmptyIdIsRejected) {
    FakeEngineFactory engines;
    PeerRegistry registry(engines.make(), 4);
    EXPECT_EQ(registry.add("", NegotiationRole::Responder).error, SignalingError::InvalidParameter);
}

TEST(PeerRegistryTests, FailedSessionIsRemoved) {
    FakeEngineFactory engines;
    PeerRegistry registry(engines.make(), 4);

    std::vector<SessionError> errors;
    registry.setErrorCallback([&errors](const SessionError& error) { errors.push_back(error); });

    auto added = registry.add("7", NegotiationRole::Initiator);
    ASSERT_TRUE(added.success());
    ASSERT_TRUE(added.value.startNegotiation().success());
    auto fake = engines.latest("7");

    fake->completeOffer(Result<std::string>::err(SignalingError::EngineFailure, "no codecs"));

    EXPECT_FALSE(registry.contains("7"));
    EXPECT_TRUE(fake->isReleased());
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].peerId, "7");
    EXPECT_EQ(registry.getMetrics().sessionsFailed, 1u);
    EXPECT_FALSE(added.value.valid());
}

TEST(PeerRegistryTests, DeferrerRunsRemoval) {
    FakeEngineFactory engines;
    PeerRegistry registry(engines.make(), 4);

    std::vector<std::function<void()>> deferred;
    registry.setDeferrer([&deferred](const PeerId& peer, SignalingError error, std::function<void()> removal) {
        EXPECT_EQ(peer, "7");
        EXPECT_EQ(error, SignalingError::ConnectionClosed);
        deferred.push_back(std::move(removal));
    });

    ASSERT_TRUE(registry.add("7", NegotiationRole::Responder).success());
    engines.latest("7")->emitState(EngineConnectionState::Failed);

    // Still registered until the owner runs the removal
    EXPECT_TRUE(registry.contains("7"));
    EXPECT_EQ(registry.lookup("7")->state(), NegotiationState::Failed);
    ASSERT_EQ(deferred.size(), 1u);

    deferred[0]();
    EXPECT_FALSE(registry.contains("7"));
}

TEST(PeerRegistryTests, StaleDeferredRemovalSparesNewSession) {
    FakeEngineFactory engines;
    PeerRegistry registry(engines.make(), 4);

    std::function<void()> deferred;
    registry.setDeferrer([&deferred](const PeerId&, SignalingError, std::function<void()> removal) {
        deferred = std::move(removal);
    });

    ASSERT_TRUE(registry.add("7", NegotiationRole::Responder).success());
    engines.latest("7")->emitState(EngineConnectionState::Failed);
    ASSERT_TRUE(deferred);

    registry.remove("7");
    ASSERT_TRUE(registry.add("7", NegotiationRole::Responder).success());

    deferred();
    EXPECT_TRUE(registry.contains("7"));
    EXPECT_FALSE(registry.lookup("7")->engineReleased());
}

TEST(PeerRegistryTests, RemoveUnlinksFanoutBranch) {
    FakeEngineFactory engines;
    MediaFanout fanout;
    PeerRegistry registry(engines.make(), 4, &fanout);

    ASSERT_TRUE(registry.add("a", NegotiationRole::Responder).success());
    ASSERT_TRUE(registry.add("b", NegotiationRole::Responder).success());
    EXPECT_EQ(fanout.branchCount(), 2u);

    auto sinkA = std::static_pointer_cast<RecordingSink>(engines.latest("a")->sink);
    auto sinkB = std::static_pointer_cast<RecordingSink>(engines.latest("b")->sink);

    EXPECT_EQ(fanout.push({0x80, 0x60}), 2u);

    registry.remove("a");
    EXPECT_FALSE(fanout.hasBranch("a"));
    EXPECT_TRUE(fanout.hasBranch("b"));
    EXPECT_FALSE(fanout.isBlocked());

    EXPECT_EQ(fanout.push({0x80, 0x60}), 1u);
    EXPECT_EQ(sinkA->packetCount(), 1u);
    EXPECT_EQ(sinkB->packetCount(), 2u);
}

TEST(PeerRegistryTests, ConcurrentAddOfSameIdIsRejectedDuringConstruction) {
    std::promise<void> entered;
    std::promise<void> release;
    auto releaseFuture = release.get_future().share();

    FakeEngineFactory engines;
    auto inner = engines.make();
    PeerEngineFactory blocking = [&, releaseFuture](const PeerId& peer, NegotiationRole role) {
        if (peer == "slow") {
            entered.set_value();
            releaseFuture.wait();
        }
        return inner(peer, role);
    };
    PeerRegistry registry(blocking, 4);

    std::thread builder([&registry] {
        auto result = registry.add("slow", NegotiationRole::Responder);
        EXPECT_TRUE(result.success());
    });
    entered.get_future().wait();

    // Constructing ids are reserved but not yet visible
    EXPECT_EQ(registry.add("slow", NegotiationRole::Responder).error, SignalingError::AlreadyExists);
    EXPECT_FALSE(registry.contains("slow"));

    // Other ids proceed while "slow" is being built
    EXPECT_TRUE(registry.add("fast", NegotiationRole::Responder).success());

    release.set_value();
    builder.join();
    EXPECT_TRUE(registry.contains("slow"));
    EXPECT_EQ(engines.built("slow"), 1u);
}

TEST(PeerRegistryTests, RemoveWaitsForConstruction) {
    std::promise<void> entered;
    std::promise<void> release;
    auto releaseFuture = release.get_future().share();

    FakeEngineFactory engines;
    auto inner = engines.make();
    PeerEngineFactory blocking = [&, releaseFuture](const PeerId& peer, NegotiationRole role) {
        entered.set_value();
        releaseFuture.wait();
        return inner(peer, role);
    };
    PeerRegistry registry(blocking, 4);

    std::thread builder([&registry] { EXPECT_TRUE(registry.add("7", NegotiationRole::Responder).success()); });
    entered.get_future().wait();

    std::atomic<bool> removed{false};
    std::thread remover([&] {
        registry.remove("7");
        removed = true;
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_FALSE(removed.load());

    release.set_value();
    builder.join();
    remover.join();
    EXPECT_TRUE(removed.load());
    EXPECT_FALSE(registry.contains("7"));
    EXPECT_TRUE(engines.latest("7")->isReleased());
}

TEST(PeerRegistryTests, ClearRemovesEverything) {
    FakeEngineFactory engines;
    PeerRegistry registry(engines.make(), 4);
    ASSERT_TRUE(registry.add("a", NegotiationRole::Responder).success());
    ASSERT_TRUE(registry.add("b", NegotiationRole::Initiator).success());

    registry.clear();
    EXPECT_EQ(registry.size(), 0u);
    EXPECT_TRUE(engines.latest("a")->isReleased());
    EXPECT_TRUE(engines.latest("b")->isReleased());
}
