#include "app/Application.hpp"

#include "app/ConsoleReporter.hpp"
#include "app/RunPlan.hpp"
#include "core/probe/CombinationGenerator.hpp"
#include "core/probe/ResultAggregator.hpp"
#include "infrastructure/input/FileZillaImporter.hpp"
#include "infrastructure/probe/ProbeScheduler.hpp"
#include "infrastructure/report/ReportWriter.hpp"

#include <QStandardPaths>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdio>
#include <iostream>
#include <unistd.h>

namespace ftpprobe::app {

Application::Application(int& argc, char** argv) {
    qtApp_ = std::make_unique<QCoreApplication>(argc, argv);
    qtApp_->setApplicationName("FtpProbe");
    qtApp_->setApplicationVersion("1.0.0");
    qtApp_->setOrganizationName("FtpProbe");

    initializeLogging();

    options_ = commandLine_.parse(qtApp_->arguments());
    if (options_.helpRequested || options_.versionRequested) {
        return;
    }

    if (options_.debug) {
        spdlog::set_level(spdlog::level::debug);
    } else if (options_.quiet) {
        spdlog::set_level(spdlog::level::err);
    }

    loadConfiguration();
    configureLogging();
}

Application::~Application() {
    spdlog::shutdown();
}

void Application::initializeLogging() {
    auto consoleSink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    consoleSink->set_pattern("[%H:%M:%S] [%^%l%$] %v");

    auto logger = std::make_shared<spdlog::logger>("ftpprobe", consoleSink);
    logger->set_level(spdlog::level::info);
    spdlog::set_default_logger(logger);
}

void Application::configureLogging() {
    const auto& cfg = config_->config();
    auto logger = spdlog::default_logger();

    auto level = spdlog::level::from_str(cfg.logLevel);
    if (level == spdlog::level::off && cfg.logLevel != "off") {
        spdlog::warn("Unknown log level '{}' in configuration, using info", cfg.logLevel);
        level = spdlog::level::info;
    }
    if (options_.debug) {
        level = spdlog::level::debug;
    } else if (options_.quiet) {
        level = spdlog::level::err;
    }

    logger->sinks().front()->set_level(level);
    logger->set_level(level);

    const auto logPath = options_.logFile.value_or(cfg.logFile);
    if (logPath.empty()) {
        return;
    }

    try {
        auto fileSink =
            std::make_shared<spdlog::sinks::rotating_file_sink_mt>(logPath, 5 * 1024 * 1024, 3);
        fileSink->set_level(spdlog::level::debug);
        logger->sinks().push_back(fileSink);
        logger->set_level(std::min(level, spdlog::level::debug));
        spdlog::debug("Log file: {}", logPath);
    } catch (const spdlog::spdlog_ex& e) {
        spdlog::error("Cannot open log file {}: {}", logPath, e.what());
    }
}

void Application::loadConfiguration() {
    const std::filesystem::path configDir =
        options_.configDir
            ? std::filesystem::path(*options_.configDir)
            : std::filesystem::path(
                  QStandardPaths::writableLocation(QStandardPaths::AppConfigLocation)
                      .toStdString());

    config_ = std::make_unique<infra::ConfigManager>(configDir);
    if (!config_->load()) {
        spdlog::warn("Using default configuration");
        config_->config() = infra::AppConfig{};
    }
}

int Application::run() {
    if (options_.helpRequested) {
        std::cout << commandLine_.helpText();
        return 0;
    }
    if (options_.versionRequested) {
        std::cout << qtApp_->applicationName().toStdString() << " "
                  << qtApp_->applicationVersion().toStdString() << std::endl;
        return 0;
    }

    const bool color = !options_.quiet && ::isatty(::fileno(stdout)) == 1;
    if (!options_.quiet) {
        ConsoleReporter::printBanner(std::cout, color);
    }

    core::ResultAggregator aggregator;
    aggregator.addAll(runProbes(color));

    const auto summary = aggregator.summary();
    spdlog::info("{} of {} probes succeeded", summary.successful, summary.total);

    infra::ReportWriter writer(std::cout);
    const size_t failures = writer.writeAll(options_.reports, aggregator.results());
    return failures == 0 ? 0 : 1;
}

std::vector<core::ProbeResult> Application::runProbes(bool color) {
    const auto& cfg = config_->config();
    const auto schedule = buildScheduleOptions(options_, cfg);

    ConsoleReporter console(std::cout, options_.mode, cfg.progressInterval, options_.quiet,
                            color);
    auto onProgress = [&console](const core::ProbeProgress& progress) {
        console.onProgress(progress);
    };

    infra::ProbeScheduler scheduler;

    switch (options_.mode) {
    case RunMode::BruteForce: {
        core::CombinationGenerator generator(buildBruteForceSpec(options_, cfg));
        console.announce(generator.totalCount());
        return scheduler.run(generator, schedule, onProgress);
    }
    case RunMode::FileZilla: {
        auto servers = infra::FileZillaImporter::parseFile(*options_.filezillaXml);
        core::DescriptorList descriptors(buildBulkDescriptors(servers, options_.checkPath));
        console.announce(descriptors.totalCount());
        return scheduler.run(descriptors, schedule, onProgress);
    }
    case RunMode::Single: {
        core::DescriptorList descriptors({buildSingleDescriptor(options_)});
        console.announce(descriptors.totalCount());
        return scheduler.run(descriptors, schedule, onProgress);
    }
    }
    return {};
}

} // namespace ftpprobe::app
