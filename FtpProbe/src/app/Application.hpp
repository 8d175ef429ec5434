#pragma once

#include "app/CommandLine.hpp"
#include "core/types/ProbeResult.hpp"
#include "infrastructure/config/ConfigManager.hpp"

#include <QCoreApplication>
#include <memory>
#include <vector>

namespace ftpprobe::app {

/**
 * @brief Wires the command line, configuration, scheduler and reports together.
 */
class Application {
public:
    /**
     * @brief Parses the command line and loads the configuration.
     * @throws std::runtime_error on invalid arguments.
     */
    Application(int& argc, char** argv);
    ~Application();

    /**
     * @brief Executes the selected mode and writes the requested reports.
     * @return Process exit code.
     */
    int run();

private:
    void initializeLogging();
    void configureLogging();
    void loadConfiguration();

    std::vector<core::ProbeResult> runProbes(bool color);

    std::unique_ptr<QCoreApplication> qtApp_;
    std::unique_ptr<infra::ConfigManager> config_;
    CommandLine commandLine_;
    CliOptions options_;
};

} // namespace ftpprobe::app
