#include <exception>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include "chunkvault/core/config.h"
#include "chunkvault/core/logger.h"
#include "chunkvault/http/http_server.h"
#include "chunkvault/http/route_registration.h"
#include "chunkvault/http/router.h"
#include "chunkvault/ledger/progress_ledger.h"
#include "chunkvault/metadata/sqlite_session_store.h"
#include "chunkvault/storage/artifact_store.h"
#include "chunkvault/storage/local_chunk_store.h"
#include "chunkvault/transfer/assembler.h"
#include "chunkvault/transfer/range_reader.h"
#include "chunkvault/transfer/reclamation_sweeper.h"
#include "chunkvault/transfer/transfer_service.h"

namespace {

std::string GetArgValue(int argc, char** argv, const std::string& key,
                        const std::string& default_value) {
    for (int i = 1; i < argc - 1; ++i) {
        if (argv[i] == key) {
            return argv[i + 1];
        }
    }
    return default_value;
}

}  // namespace

int main(int argc, char** argv) {
    const std::string config_path = GetArgValue(argc, argv, "--config", "config/server.json");
    const std::string db_path = GetArgValue(argc, argv, "--database", "config/database.json");

    chunkvault::core::Config config;
    std::string sqlite_path;
    try {
        config = chunkvault::core::LoadConfig(config_path);
        sqlite_path = chunkvault::core::LoadDatabasePath(db_path);
    } catch (const std::exception& ex) {
        std::cerr << "invalid configuration: " << ex.what() << std::endl;
        return 1;
    }
    chunkvault::core::InitLogging(config.observability.log_level);

    std::shared_ptr<chunkvault::ledger::ProgressLedger> ledger;
    std::shared_ptr<chunkvault::storage::LocalChunkStore> chunks;
    std::shared_ptr<chunkvault::transfer::TransferService> service;
    try {
        const auto db_dir = std::filesystem::path(sqlite_path).parent_path();
        if (!db_dir.empty()) {
            std::filesystem::create_directories(db_dir);
        }
        auto sessions = std::make_shared<chunkvault::metadata::SqliteSessionStore>(sqlite_path);
        ledger = std::make_shared<chunkvault::ledger::ProgressLedger>(sessions);
        chunks = std::make_shared<chunkvault::storage::LocalChunkStore>(
            (std::filesystem::path(config.storage.temp_path) / "chunks").string(), ledger);
        auto artifacts = std::make_shared<chunkvault::storage::ArtifactStore>(
            config.storage.base_path, config.storage.temp_path);
        auto assembler =
            std::make_shared<chunkvault::transfer::Assembler>(ledger, chunks, artifacts);
        auto reader = std::make_shared<chunkvault::transfer::RangeReader>(ledger, artifacts);
        service = std::make_shared<chunkvault::transfer::TransferService>(
            ledger, chunks, artifacts, assembler, reader);
    } catch (const std::exception& ex) {
        chunkvault::core::LogError("failed to open storage: " + std::string(ex.what()));
        return 1;
    }

    auto loaded = ledger->Load();
    if (!loaded.ok()) {
        chunkvault::core::LogError("failed to load upload sessions: " + loaded.error().message);
        return 1;
    }
    service->Recover();

    chunkvault::http::Router router;
    chunkvault::http::RegisterDefaultRoutes(router, service, config);

    boost::asio::io_context ioc(config.server.threads);
    chunkvault::transfer::ReclamationSweeper sweeper(ledger, chunks, config.cleanup);
    std::unique_ptr<chunkvault::http::HttpServer> server;
    try {
        server = std::make_unique<chunkvault::http::HttpServer>(ioc, config, std::move(router),
                                                                service);
        server->Run();
    } catch (const std::exception& ex) {
        chunkvault::core::LogError("failed to start listener: " + std::string(ex.what()));
        return 1;
    }
    sweeper.Start(ioc);
    chunkvault::core::LogInfo("chunkvault listening on " + config.server.host + ":" +
                              std::to_string(config.server.port));

    boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&ioc, &sweeper](const boost::system::error_code&, int signal_number) {
        chunkvault::core::LogInfo("received signal " + std::to_string(signal_number) +
                                  ", shutting down");
        sweeper.Stop();
        ioc.stop();
    });

    std::vector<std::thread> threads;
    threads.reserve(static_cast<size_t>(config.server.threads));
    for (int i = 0; i < config.server.threads; ++i) {
        threads.emplace_back([&ioc]() { ioc.run(); });
    }
    for (auto& t : threads) {
        t.join();
    }

    return 0;
}
