/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the PeerRelay project.
 */

#include <gtest/gtest.h>

#include "../src/Signaling/Actor/Supervisor.h"
#include "SignalingTestHelpers.h"

#include <functional>
#include <thread>

using namespace PeerRelay::Signaling;
using namespace PeerRelay::Signaling::Testing;
using namespace std::chrono_literals;

namespace {

// Builds inline ProbeActors and remembers each one
struct ProbeFactory {
    RouteKey key;
    std::mutex mutex;
    std::vector<std::shared_ptr<ProbeActor>> built;

    std::function<void(size_t)> beforeBuild;    // receives the number of actors built so far

    explicit ProbeFactory(RouteKey k) : key(std::move(k)) {}

    Supervisor::ActorFactory make() {
        return [this]() -> std::shared_ptr<Actor> {
            if (beforeBuild) beforeBuild(count());
            auto actor = std::make_shared<ProbeActor>(key, nullptr);
            std::lock_guard<std::mutex> lock(mutex);
            built.push_back(actor);
            return actor;
        };
    }

    size_t count() {
        std::lock_guard<std::mutex> lock(mutex);
        return built.size();
    }

    std::shared_ptr<ProbeActor> latest() {
        std::lock_guard<std::mutex> lock(mutex);
        return built.empty() ? nullptr : built.back();
    }
};

} // namespace

TEST(SupervisorTests, BackoffDoublesUpToCap) {
    Router router;
    Supervisor supervisor(router, RestartPolicy::infiniteWithBackoff(100ms, 1000ms));

    EXPECT_EQ(supervisor.backoffFor(0), 100ms);
    EXPECT_EQ(supervisor.backoffFor(1), 200ms);
    EXPECT_EQ(supervisor.backoffFor(2), 400ms);
    EXPECT_EQ(supervisor.backoffFor(3), 800ms);
    EXPECT_EQ(supervisor.backoffFor(4), 1000ms);
    EXPECT_EQ(supervisor.backoffFor(40), 1000ms);
    EXPECT_EQ(supervisor.backoffFor(UINT32_MAX), 1000ms);
}

TEST(SupervisorTests, NonBackoffPoliciesHaveNoDelay) {
    Router router;
    Supervisor supervisor(router, RestartPolicy::upTo(3));
    EXPECT_EQ(supervisor.backoffFor(5), 0ms);
}

TEST(SupervisorTests, SpawnRegistersActor) {
    Router router;
    Supervisor supervisor(router, RestartPolicy::upTo(3));
    ProbeFactory factory(RouteKey::forPeer("7"));

    ASSERT_TRUE(supervisor.spawn(RouteKey::forPeer("7"), factory.make()).success());
    EXPECT_TRUE(supervisor.isSupervised(RouteKey::forPeer("7")));
    EXPECT_EQ(router.find(RouteKey::forPeer("7")), factory.latest());

    EXPECT_EQ(supervisor.spawn(RouteKey::forPeer("7"), factory.make()).error, SignalingError::AlreadyExists);
    EXPECT_EQ(factory.count(), 1u);
}

TEST(SupervisorTests, SpawnRejectsBadFactories) {
    Router router;
    Supervisor supervisor(router, RestartPolicy::upTo(3));

    EXPECT_EQ(supervisor.spawn(RouteKey::server(), nullptr).error, SignalingError::InvalidParameter);
    EXPECT_EQ(supervisor.spawn(RouteKey::server(), [] { return std::shared_ptr<Actor>(); }).error,
              SignalingError::InvalidParameter);
    EXPECT_EQ(supervisor.spawn(RouteKey::server(),
                               [] { return std::make_shared<ProbeActor>(RouteKey::client(), nullptr); })
                  .error,
              SignalingError::InvalidParameter);
    EXPECT_EQ(supervisor.spawn(RouteKey::server(),
                               []() -> std::shared_ptr<Actor> { throw std::runtime_error("no"); })
                  .error,
              SignalingError::EngineFailure);
    EXPECT_FALSE(supervisor.isSupervised(RouteKey::server()));
    EXPECT_EQ(router.size(), 0u);
}

TEST(SupervisorTests, NeverLeavesFailedActorInPlace) {
    Router router;
    Supervisor supervisor(router, RestartPolicy::never());
    ProbeFactory factory(RouteKey::client());
    ASSERT_TRUE(supervisor.spawn(RouteKey::client(), factory.make()).success());

    ASSERT_TRUE(router.send(RouteKey::client(), StartNegotiation{"fail"}).success());

    EXPECT_EQ(factory.count(), 1u);
    EXPECT_EQ(factory.latest()->status(), ActorStatus::Failed);
    EXPECT_TRUE(router.contains(RouteKey::client()));
    EXPECT_EQ(router.send(RouteKey::client(), StartNegotiation{"x"}).error, SignalingError::MailboxClosed);
    EXPECT_EQ(supervisor.restartCount(RouteKey::client()), 0u);
}

TEST(SupervisorTests, UpToNRestartsWithFreshState) {
    Router router;
    Supervisor supervisor(router, RestartPolicy::upTo(2));
    ProbeFactory factory(RouteKey::forPeer("7"));

    std::vector<uint32_t> restarts;
    supervisor.setRestartCallback([&](const RouteKey& key, uint32_t n) {
        EXPECT_EQ(key, RouteKey::forPeer("7"));
        restarts.push_back(n);
    });

    ASSERT_TRUE(supervisor.spawn(RouteKey::forPeer("7"), factory.make()).success());
    ASSERT_TRUE(router.send(RouteKey::forPeer("7"), StartNegotiation{"work"}).success());
    auto original = factory.latest();

    ASSERT_TRUE(router.send(RouteKey::forPeer("7"), StartNegotiation{"fail"}).success());
    ASSERT_EQ(factory.count(), 2u);
    auto replacement = factory.latest();
    EXPECT_NE(replacement, original);
    EXPECT_EQ(router.find(RouteKey::forPeer("7")), replacement);
    EXPECT_EQ(replacement->status(), ActorStatus::Running);
    EXPECT_EQ(replacement->handledCount(), 0u);

    ASSERT_TRUE(router.send(RouteKey::forPeer("7"), StartNegotiation{"fail"}).success());
    ASSERT_EQ(factory.count(), 3u);

    // Third failure exceeds the restart limit
    ASSERT_TRUE(router.send(RouteKey::forPeer("7"), StartNegotiation{"fail"}).success());
    EXPECT_EQ(factory.count(), 3u);
    EXPECT_EQ(factory.latest()->status(), ActorStatus::Failed);
    EXPECT_EQ(supervisor.restartCount(RouteKey::forPeer("7")), 2u);
    EXPECT_EQ(restarts, (std::vector<uint32_t>{1, 2}));
}

TEST(SupervisorTests, BackoffRestartsAfterDelay) {
    Router router;
    Supervisor supervisor(router, RestartPolicy::infiniteWithBackoff(20ms, 80ms));
    ProbeFactory factory(RouteKey::transport());
    ASSERT_TRUE(supervisor.spawn(RouteKey::transport(), factory.make()).success());

    auto start = std::chrono::steady_clock::now();
    ASSERT_TRUE(router.send(RouteKey::transport(), StartNegotiation{"fail"}).success());
    EXPECT_EQ(factory.count(), 1u);

    ASSERT_TRUE(waitFor([&] { return factory.count() == 2; }));
    EXPECT_GE(std::chrono::steady_clock::now() - start, 20ms);
    ASSERT_TRUE(waitFor([&] { return router.find(RouteKey::transport()) == factory.latest(); }));

    // Keeps restarting well past any fixed limit
    for (size_t i = 2; i < 6; ++i) {
        ASSERT_TRUE(router.send(RouteKey::transport(), StartNegotiation{"fail"}).success());
        ASSERT_TRUE(waitFor([&] { return factory.count() == i + 1; }));
        ASSERT_TRUE(waitFor([&] { return router.find(RouteKey::transport()) == factory.latest(); }));
    }
    EXPECT_EQ(supervisor.restartCount(RouteKey::transport()), 5u);
}

TEST(SupervisorTests, RetireStopsAndForgetsActor) {
    Router router;
    Supervisor supervisor(router, RestartPolicy::upTo(3));
    ProbeFactory factory(RouteKey::roomMember(0));
    ASSERT_TRUE(supervisor.spawn(RouteKey::roomMember(0), factory.make()).success());
    auto actor = factory.latest();

    supervisor.retire(RouteKey::roomMember(0));
    EXPECT_FALSE(supervisor.isSupervised(RouteKey::roomMember(0)));
    EXPECT_FALSE(router.contains(RouteKey::roomMember(0)));
    EXPECT_EQ(actor->status(), ActorStatus::Stopped);
    EXPECT_TRUE(actor->stopped.load());

    // The key can be supervised again
    EXPECT_TRUE(supervisor.spawn(RouteKey::roomMember(0), factory.make()).success());
}

TEST(SupervisorTests, ExhaustedPolicyMarksActorDown) {
    Router router;
    Supervisor supervisor(router, RestartPolicy::upTo(1));
    ProbeFactory factory(RouteKey::transport());
    ASSERT_TRUE(supervisor.spawn(RouteKey::transport(), factory.make()).success());
    EXPECT_FALSE(supervisor.isDown(RouteKey::transport()));

    ASSERT_TRUE(router.send(RouteKey::transport(), StartNegotiation{"fail"}).success());
    EXPECT_FALSE(supervisor.isDown(RouteKey::transport()));

    ASSERT_TRUE(router.send(RouteKey::transport(), StartNegotiation{"fail"}).success());
    EXPECT_TRUE(supervisor.isDown(RouteKey::transport()));

    supervisor.retire(RouteKey::transport());
    EXPECT_FALSE(supervisor.isDown(RouteKey::transport()));
}

TEST(SupervisorTests, RetireDuringRebuildLeavesKeyUnrouted) {
    Router router;
    Supervisor supervisor(router, RestartPolicy::upTo(3));
    ProbeFactory factory(RouteKey::forPeer("7"));
    factory.beforeBuild = [&](size_t built) {
        if (built == 1) {
            supervisor.retire(RouteKey::forPeer("7"));
        }
    };
    ASSERT_TRUE(supervisor.spawn(RouteKey::forPeer("7"), factory.make()).success());

    ASSERT_TRUE(router.send(RouteKey::forPeer("7"), StartNegotiation{"fail"}).success());

    ASSERT_EQ(factory.count(), 2u);
    EXPECT_FALSE(supervisor.isSupervised(RouteKey::forPeer("7")));
    EXPECT_FALSE(router.contains(RouteKey::forPeer("7")));
    EXPECT_TRUE(factory.latest()->stopped.load());
    EXPECT_EQ(factory.latest()->status(), ActorStatus::Stopped);
}

TEST(SupervisorTests, PendingRestartDoesNotReplaceRespawnedActor) {
    Router router;
    Supervisor supervisor(router, RestartPolicy::infiniteWithBackoff(50ms, 50ms));
    ProbeFactory factory(RouteKey::transport());
    ASSERT_TRUE(supervisor.spawn(RouteKey::transport(), factory.make()).success());
    ASSERT_TRUE(router.send(RouteKey::transport(), StartNegotiation{"fail"}).success());

    supervisor.retire(RouteKey::transport());
    ASSERT_TRUE(supervisor.spawn(RouteKey::transport(), factory.make()).success());
    auto respawned = factory.latest();

    std::this_thread::sleep_for(200ms);
    EXPECT_EQ(factory.count(), 2u);
    EXPECT_EQ(router.find(RouteKey::transport()), respawned);
    EXPECT_EQ(supervisor.restartCount(RouteKey::transport()), 0u);
}

TEST(SupervisorTests, ShutdownCancelsPendingRestarts) {
    Router router;
    ProbeFactory factory(RouteKey::transport());
    {
        Supervisor supervisor(router, RestartPolicy::infiniteWithBackoff(500ms, 500ms));
        ASSERT_TRUE(supervisor.spawn(RouteKey::transport(), factory.make()).success());
        ASSERT_TRUE(router.send(RouteKey::transport(), StartNegotiation{"fail"}).success());

        supervisor.shutdown();
        EXPECT_EQ(router.size(), 0u);
        EXPECT_EQ(supervisor.spawn(RouteKey::server(), factory.make()).error, SignalingError::MailboxClosed);
    }
    std::this_thread::sleep_for(50ms);
    EXPECT_EQ(factory.count(), 1u);
}
