/**
 * @file main.cpp
 * @brief Transfer pipeline service entry point
 */

// System Includes
#include <signal.h>

// Standard Library Includes
#include <cstdlib>
#include <exception>
#include <filesystem>

// Third Party Includes
#include <spdlog/cfg/env.h>
#include <spdlog/spdlog.h>

// Project Includes
#include <ferry/pipeline/CatalogClient.hpp>
#include <ferry/pipeline/ControlHandler.hpp>
#include <ferry/pipeline/ControlServer.hpp>
#include <ferry/pipeline/Credentials.hpp>
#include <ferry/pipeline/CurlDownloader.hpp>
#include <ferry/pipeline/DedupeLedger.hpp>
#include <ferry/pipeline/EventPublisher.hpp>
#include <ferry/pipeline/Http.hpp>
#include <ferry/pipeline/LogNotifier.hpp>
#include <ferry/pipeline/Notifier.hpp>
#include <ferry/pipeline/PipelineConfig.hpp>
#include <ferry/pipeline/PipelineStats.hpp>
#include <ferry/pipeline/Scheduler.hpp>
#include <ferry/pipeline/StagingStore.hpp>
#include <ferry/pipeline/TransferPipeline.hpp>
#include <ferry/pipeline/Uploader.hpp>
#include <ferry/pipeline/YouTubeSinkApi.hpp>

namespace
{
auto config_path() -> std::filesystem::path
{
    // NOLINTNEXTLINE(*-mt-unsafe)
    const auto* configEnv = std::getenv("FERRY_CONFIG");

    return configEnv != nullptr ? configEnv : "configs/pipeline.json";
}

// Blocked before any thread starts so only the main thread sees them
auto block_shutdown_signals() -> ::sigset_t
{
    ::sigset_t signals;
    ::sigemptyset(&signals);
    ::sigaddset(&signals, SIGINT);
    ::sigaddset(&signals, SIGTERM);
    ::pthread_sigmask(SIG_BLOCK, &signals, nullptr);

    return signals;
}
} // namespace

auto main() -> int
{
    using namespace ferry::pipeline;

    spdlog::cfg::load_env_levels();

    try
    {
        const auto shutdownSignals = block_shutdown_signals();

        const http::CurlGlobal curlGlobal {};
        const PipelineConfig   config = PipelineConfig::load(config_path());

        std::filesystem::create_directories(config.dataDirectory);

        const StagingStore staging(config.stagingDirectory);
        if (const auto swept = staging.sweep(); swept > 0)
        {
            spdlog::info("Removed {} leftover staged file(s)", swept);
        }

        DedupeLedger ledger(config.ledger_file());
        ledger.load();

        PipelineStats stats(config.stats_file());
        stats.load();

        LogNotifier    logNotifier {};
        EventPublisher eventPublisher(config.eventEndpoint);
        NotifierGroup  notifiers {};
        notifiers.add(logNotifier);
        notifiers.add(eventPublisher);

        CurlDownloader downloader(config.maxPayloadBytes, config.downloadTimeout);

        TokenFileCredentials credentials(config.sinkTokenFile);
        YouTubeSinkApi       sink(
            config.sinkEndpoint,
            credentials,
            config.sinkRequestTimeout
        );
        Uploader uploader(sink, config.uploadChunkBytes);

        TransferPipeline pipeline(
            downloader,
            uploader,
            staging,
            notifiers,
            TransferPipeline::Settings {
                .downloadPolicy = {
                    .minInterval   = config.throttleMinInterval,
                    .maxInterval   = config.throttleMaxInterval,
                    .percentOffset = 0,
                },
                .uploadPolicy = {
                    .minInterval   = config.throttleMinInterval,
                    .maxInterval   = config.throttleMaxInterval,
                    .percentOffset = config.uploadReservedPercent,
                },
                .dryRun = config.dryRun,
            }
        );

        Scheduler scheduler(
            pipeline,
            ledger,
            stats,
            notifiers,
            Scheduler::Settings {
                .pausePollInterval = config.pausePollInterval,
                .quiescenceDelay   = config.quiescenceDelay,
                .saveInterval      = config.saveInterval,
                .finishedHistory   = config.finishedHistory,
            }
        );

        const CatalogClient catalog(config.catalogBaseUrl, config.catalogApiKey);
        ControlHandler      handler(scheduler, stats, ledger, catalog);
        ControlServer       controlServer(handler, config.controlEndpoint);

        scheduler.start();
        controlServer.start();

        spdlog::info("Transfer pipeline running");

        int received = 0;
        ::sigwait(&shutdownSignals, &received);

        spdlog::info("Received signal {}, shutting down", received);

        controlServer.stop();
        scheduler.stop();
    }
    catch (const std::exception& e)
    {
        spdlog::error("{}", e.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
