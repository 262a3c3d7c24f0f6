// This Source Code Form is subject to the terms of the Mozilla Public
// License, v. 2.0. If a copy of the MPL was not distributed with this
// file, You can obtain one at https://mozilla.org/MPL/2.0/.

#include "../src/Signaling/Actor/SignalingService.h"
#include "../src/Signaling/Core/SignalingConfig.h"
#include "../src/Signaling/Engine/MediaFanout.h"
#include "../src/Signaling/Engine/RtcPeerEngine.h"
#include "../src/Signaling/Engine/RtpIngest.h"
#include "../src/Signaling/Transport/WebSocketTransport.h"
#include <EntropyCore.h>
#include <Concurrency/WorkService.h>
#include <Concurrency/WorkContractGroup.h>
#include <rtc/rtc.hpp>
#include <algorithm>
#include <atomic>
#include <csignal>
#include <iostream>
#include <iterator>
#include <memory>
#include <mutex>
#include <thread>
#include <chrono>
#include <vector>

using namespace std;
using namespace PeerRelay::Signaling;
using namespace EntropyEngine::Core::Concurrency;

namespace {
atomic<bool> g_running{true};

void onSignal(int) {
    g_running = false;
}
}

// Usage: peer_relay_server [config.json] [stream-index]
//
// With transport.url set the relay dials that signaling server (room or
// per-peer framing). Without it the relay listens on transport.listenPort and
// answers every WebSocket client as a single peer.
int main(int argc, char** argv) {
    try {
        RelayConfig config;
        if (argc > 1) {
            auto loaded = loadRelayConfig(argv[1]);
            if (loaded.failed()) {
                cerr << "Config error: " << loaded.errorMessage << endl;
                return 1;
            }
            config = std::move(loaded.value);
        }
        size_t streamIndex = argc > 2 ? static_cast<size_t>(stoul(argv[2])) : 0;

        signal(SIGINT, onSignal);
        signal(SIGTERM, onSignal);

        cout << "Starting PeerRelay (" << routingModeToString(config.routingMode) << " routing)" << endl;

        WorkService::Config workConfig;
        workConfig.threadCount = config.workerThreads != 0 ? config.workerThreads : 4;
        WorkService workService(workConfig);

        WorkContractGroup relayGroup(4096, "PeerRelay");
        workService.addWorkContractGroup(&relayGroup);
        workService.start();

        // Camera feed: RTP on 127.0.0.1:<rtpBasePort + stream>
        MediaFanout fanout;
        unique_ptr<RtpIngest> ingest;
        if (streamIndex < config.rtpStreamCount) {
            auto port = static_cast<uint16_t>(config.rtpBasePort + streamIndex);
            ingest = make_unique<RtpIngest>(&fanout, "127.0.0.1", port);
            auto started = ingest->start();
            if (started.failed()) {
                cerr << "RTP ingest failed: " << started.errorMessage << endl;
                return 1;
            }
            cout << "Relaying RTP from 127.0.0.1:" << ingest->port() << endl;
        }

        auto engineFactory = RtcPeerEngine::factory(config.engine, &relayGroup);
        auto reportError = [](const SessionError& error) {
            cerr << "Peer " << error.peerId << " failed in " << negotiationStateToString(error.state) << ": "
                 << error.message << endl;
        };

        vector<unique_ptr<SignalingService>> services;
        mutex servicesMutex;
        unique_ptr<rtc::WebSocketServer> wsServer;
        atomic<uint32_t> clientCount{0};

        if (!config.transport.url.empty()) {
            auto transportConfig = config.transport;
            auto service = make_unique<SignalingService>(
                config, engineFactory,
                [transportConfig]() { return make_shared<WebSocketTransport>(transportConfig); }, &fanout,
                &relayGroup);
            service->setSessionErrorCallback(reportError);

            auto started = service->start();
            if (started.failed()) {
                cerr << "Could not reach signaling server " << config.transport.url << ": " << started.errorMessage
                     << endl;
                workService.stop();
                return 1;
            }
            cout << "Connected to " << config.transport.url << " as '" << config.transport.localId << "'" << endl;
            services.push_back(std::move(service));
        } else {
            rtc::WebSocketServer::Configuration wsConfig;
            wsConfig.port = config.transport.listenPort;
            wsConfig.enableTls = config.transport.enableTls;
            wsServer = make_unique<rtc::WebSocketServer>(wsConfig);

            wsServer->onClient([&](shared_ptr<rtc::WebSocket> ws) {
                RelayConfig clientConfig = config;
                clientConfig.routingMode = RoutingMode::SinglePeer;
                clientConfig.singlePeerRole = NegotiationRole::Initiator;
                clientConfig.singlePeerId = "client_" + to_string(clientCount++);
                // An accepted socket cannot be re-dialed, so only the first build gets it
                clientConfig.restartPolicy = RestartPolicy::never();

                auto accepted = make_shared<shared_ptr<rtc::WebSocket>>(std::move(ws));
                auto service = make_unique<SignalingService>(
                    clientConfig, engineFactory,
                    [accepted]() -> shared_ptr<SignalingTransport> {
                        if (!*accepted) return nullptr;
                        auto transport = make_shared<WebSocketTransport>(std::move(*accepted));
                        accepted->reset();
                        return transport;
                    },
                    &fanout, &relayGroup);
                service->setSessionErrorCallback(reportError);

                auto started = service->start();
                if (started.failed()) {
                    cerr << "Client " << clientConfig.singlePeerId << " rejected: " << started.errorMessage << endl;
                    return;
                }
                cout << "Client " << clientConfig.singlePeerId << " connected" << endl;
                lock_guard<mutex> lock(servicesMutex);
                services.push_back(std::move(service));
            });
            cout << "Signaling server listening on port " << wsServer->port() << endl;
        }

        cout << "Press Ctrl+C to quit" << endl;
        while (g_running) {
            this_thread::sleep_for(chrono::milliseconds(200));

            // Disconnected clients take their sessions and fan-out branches with them
            vector<unique_ptr<SignalingService>> finished;
            {
                lock_guard<mutex> lock(servicesMutex);
                auto down = std::stable_partition(services.begin(), services.end(),
                                                  [](const auto& service) { return !service->isChannelDown(); });
                std::move(down, services.end(), std::back_inserter(finished));
                services.erase(down, services.end());
            }
            for (auto& service : finished) {
                cout << "Client " << service->config().singlePeerId << " disconnected" << endl;
                service->stop();
            }
            if (!config.transport.url.empty() && !finished.empty()) {
                cerr << "Lost the signaling server" << endl;
                break;
            }
        }

        cout << "\nShutting down..." << endl;
        wsServer.reset();
        {
            lock_guard<mutex> lock(servicesMutex);
            for (auto& service : services) {
                service->stop();
            }
            services.clear();
        }
        if (ingest) {
            ingest->stop();
        }
        workService.stop();

    } catch (const exception& e) {
        cerr << "Error: " << e.what() << endl;
        return 1;
    }

    return 0;
}
