#include "agent_context.hpp"
#include "cache_store.hpp"
#include "cli_options.hpp"
#include "config.hpp"
#include "config_validator.hpp"
#include "console_channel.hpp"
#include "decoder.hpp"
#include "errors.hpp"
#include "file_channel.hpp"
#include "health.hpp"
#include "mail_channel.hpp"
#include "mail_sender.hpp"
#include "notification_dispatcher.hpp"
#include "process_supervisor.hpp"
#include "report_pipeline.hpp"
#include "shutdown.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <curl/curl.h>
#include <iostream>

namespace {

int exit_with(ExitCode code) {
    return static_cast<int>(code);
}

// Restores the persisted cache and drops what expired while we were down
void restore_cache(DedupCache& cache, const CacheStore& store) {
    try {
        cache.restore(store.load());
    } catch (const PersistenceError& e) {
        spdlog::error("Cannot restore dedup cache from {}: {}. Starting empty.", store.path(), e.what());
        return;
    }
    auto evicted = cache.evict_expired(DedupCache::Clock::now());
    spdlog::info("Dedup cache restored: {} entries ({} expired)", cache.size(), evicted);
}

void dump_cache(const DedupCache& cache, const CacheStore& store) {
    try {
        store.save(cache.snapshot());
        spdlog::info("Dedup cache saved to {} ({} entries)", store.path(), cache.size());
    } catch (const PersistenceError& e) {
        spdlog::error("Cannot save dedup cache: {}", e.what());
    }
}

}

int main(int argc, char** argv) {
    CliOptions options;
    try {
        options = parse_cli(argc, argv);
    } catch (const std::invalid_argument& e) {
        std::cerr << e.what() << "\n" << usage(argv[0]);
        return exit_with(ExitCode::kUsage);
    }
    if (options.help) {
        std::cout << usage(argv[0]);
        return 0;
    }

    util::setup_logging(options.log_level.value_or("info"));

    Config config;
    try {
        config = Config::load(options.config_path);
        config.load_from_env();
        if (options.log_level) {
            config.log_level = *options.log_level;
        }
        if (options.report_path) {
            config.file.path = *options.report_path;
        }
        if (options.no_report) {
            config.file.use = false;
        }
        config.validate();
    } catch (const ConfigError& e) {
        spdlog::critical("Invalid configuration: {}", e.what());
        return exit_with(ExitCode::kConfigInvalid);
    }
    util::setup_logging(config.log_level);
    spdlog::info("Configuration loaded for service: {}", config.service_name);

    std::unique_ptr<Decoder> decoder;
    try {
        auto vocabulary = Vocabulary::load(config.vocabulary_path);
        auto failures = validate_keywords(config, vocabulary);
        if (!failures.empty()) {
            log_validation_failures(failures);
            spdlog::critical("Configuration file has illegal keywords. Terminate...");
            return exit_with(ExitCode::kConfigInvalid);
        }
        decoder = make_decoder(config.source_type);
    } catch (const ConfigError& e) {
        spdlog::critical("Invalid configuration: {}", e.what());
        return exit_with(ExitCode::kConfigInvalid);
    }

    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
        spdlog::critical("curl_global_init failed");
        return exit_with(ExitCode::kPipelineFailure);
    }

    ShutdownSignal shutdown;
    install_signal_handlers(shutdown);

    DedupCache cache(config.cache_valid_period());
    CacheStore store(config.cache_path);
    if (!options.no_load) {
        restore_cache(cache, store);
    }

    AgentStatus status;
    status.cache_entries = cache.size();
    AgentContext context{config, cache, status, shutdown};

    ExitCode code = ExitCode::kSignalShutdown;
    try {
        NotificationDispatcher dispatcher;
        if (config.file.use) {
            dispatcher.add_channel(std::make_unique<FileChannel>(
                config.file, FileChannel::make_report_logger(config.file)));
        }
        CurlMailSender mail_sender(config.mail, &shutdown);
        dispatcher.add_channel(std::make_unique<MailChannel>(config.mail, mail_sender));
        dispatcher.add_channel(std::make_unique<ConsoleChannel>(
            config.console, ConsoleChannel::make_stdout_logger()));

        ReportPipeline pipeline(context, dispatcher);

        std::unique_ptr<HealthChecker> health;
        if (config.health.use) {
            health = std::make_unique<HealthChecker>(
                config.health.host, config.health.port, config.service_name, status);
            health->start();
        }

        ProcessSupervisor supervisor(context, *decoder, [&](const Report& report) {
            pipeline.process(report, DedupCache::Clock::now());
        });

        try {
            supervisor.run();
            spdlog::error("Signal handler called with signal {}. Terminate...", last_signal());
        } catch (const SpawnError& e) {
            spdlog::critical("Cannot start producer '{}': {}", config.source_command, e.what());
            code = ExitCode::kSpawnFailure;
        }

        if (health) {
            health->stop();
        }
    } catch (const spdlog::spdlog_ex& e) {
        spdlog::critical("Cannot open report sink: {}", e.what());
        code = ExitCode::kConfigInvalid;
    } catch (const std::exception& e) {
        spdlog::critical("Producer pipeline failed: {}. Terminate...", e.what());
        code = ExitCode::kPipelineFailure;
    }

    if (!options.no_dump) {
        dump_cache(cache, store);
    }

    curl_global_cleanup();
    spdlog::shutdown();
    return exit_with(code);
}
