/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "Ledger.hpp"
#include "LedgerApi.hpp"
#include "server.hpp"

#include <CLI/CLI.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

//-------------------------------------------------------------------------

int main(int argc, char* argv[])
{
    CLI::App app{"UniLedger v1.0"};

    fs::path configFile;
    app.add_option("-f,--config-file", configFile, "Ledger config file")
        ->required()
        ->check(CLI::ExistingFile);

    std::optional<fs::path> checkpointFile;
    app.add_option(
        "-c,--checkpoint-file",
        checkpointFile,
        "Checkpoint file, loaded at startup when present and written on shutdown");

    CLI11_PARSE(app, argc, argv);

    auto config = uniledger::config::loadLedgerConfig(configFile);
    if (!checkpointFile.has_value()) {
        checkpointFile = config.checkpoint;
    }

    auto logger = spdlog::stdout_color_mt("uniledger");
    logger->set_level(spdlog::level::from_str(config.logging.level));
    spdlog::set_default_logger(logger);

    logger->info("{}", app.get_description());

    const auto serverConfig = config.server;
    const auto logDir = config.logging.dir;

    auto ledger = checkpointFile.has_value() && fs::exists(checkpointFile.value())
        ? uniledger::Ledger::fromCheckpoint(std::move(config), checkpointFile.value())
        : std::make_unique<uniledger::Ledger>(std::move(config));
    if (checkpointFile.has_value() && fs::exists(checkpointFile.value())) {
        logger->info("Restored state from {}", checkpointFile->string());
    }

    ledger->enableAuditLogs(logDir);

    const uniledger::api::LedgerApi api{ledger.get()};

    std::latch serverReady{1};
    std::stop_source stopSource;
    uniledger::server::runServer(
        {
            .host = serverConfig.host,
            .port = serverConfig.port,
            .threads = serverConfig.threads,
            .api = &api,
            .stopOnSignal = true
        },
        serverReady,
        stopSource.get_token());

    if (checkpointFile.has_value()) {
        ledger->saveCheckpoint(checkpointFile.value());
        logger->info("Saved state to {}", checkpointFile->string());
    }

    logger->info("Shut down");

    return 0;
}

//-------------------------------------------------------------------------
