#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include <grpcpp/grpcpp.h>
#include <spdlog/spdlog.h>

#include "config/Config.hpp"
#include "dispatcher/Dispatcher.hpp"
#include "logging/Logging.hpp"
#include "process/TerminationSignal.hpp"
#include "rtc/RtcLogging.hpp"
#include "rtc/RtcPeer.hpp"
#include "service/EventBroadcaster.hpp"
#include "service/LocalMeshServiceImpl.hpp"
#include "session/PeerSession.hpp"

#include "localmesh_service.grpc.pb.h"

namespace {

constexpr auto kShutdownGrace = std::chrono::seconds(2);

}

int main(int argc, char** argv) {
    auto config = localmesh::config::parseCommandLine(argc, argv);
    if (!config) {
        std::cerr << "localmeshd: " << config.error() << "\n\n" << localmesh::config::usage();
        return 2;
    }
    if (config->help) {
        std::cout << localmesh::config::usage();
        return 0;
    }

    // Before any thread exists, so all of them inherit the mask.
    localmesh::process::blockTerminationSignals();

    const auto level = localmesh::logging::parseLogLevel(config->logLevel).value_or(spdlog::level::info);
    localmesh::logging::initLogging(level);
    localmesh::rtc::installRtcLogBridge(level);

    localmesh::dispatch::Dispatcher dispatcher;
    dispatcher.start();

    const localmesh::session::SessionOptions options{
        .channelLabel = config->channelLabel,
        .enableMedia = config->enableMedia,
        .gatheringTimeout = config->gatheringTimeout,
        .bufferedAmountHighWatermark = config->bufferedAmountHighWatermark,
    };
    const localmesh::config::Config transportConfig = *config;
    auto session = std::make_shared<localmesh::session::PeerSession>(dispatcher,
        [transportConfig]() -> std::unique_ptr<localmesh::rtc::ITransport> {
            return std::make_unique<localmesh::rtc::RtcPeer>(transportConfig);
        },
        options);
    auto broadcaster = std::make_shared<localmesh::rpc::EventBroadcaster>(config->downloadDirectory);

    dispatcher.invoke([&session, &broadcaster]() {
        session->attachObserver(broadcaster);
        session->start();
    }).get();

    localmesh::rpc::LocalMeshServiceImpl service(session, dispatcher, broadcaster);

    grpc::ServerBuilder builder;
    builder.AddListeningPort(config->listenAddress, grpc::InsecureServerCredentials());
    builder.RegisterService(&service);

    std::unique_ptr<grpc::Server> server(builder.BuildAndStart());
    if (!server) {
        spdlog::critical("failed to start gRPC server on {}", config->listenAddress);
        dispatcher.stop();
        return 1;
    }

    spdlog::info("localmesh daemon listening on {}", config->listenAddress);
    std::thread waiter([&server, &broadcaster]() {
        const int signal = localmesh::process::waitForTerminationSignal();
        spdlog::info("received signal {}, shutting down", signal);
        // Streaming calls block Shutdown() until they return.
        broadcaster->closeAll();
        server->Shutdown(std::chrono::system_clock::now() + kShutdownGrace);
    });

    server->Wait();
    waiter.join();

    dispatcher.invoke([&session]() { session->close(); }).get();
    dispatcher.stop();
    return 0;
}
