#pragma once

#include "app/CommandLine.hpp"
#include "core/services/IProbeScheduler.hpp"

#include <cstddef>
#include <ostream>

namespace ftpprobe::app {

/**
 * @brief Prints probe progress to the console.
 *
 * Brute-force runs print every successful login and a progress line every
 * progressInterval completions. Bulk and single runs print every result
 * with its errors. The scheduler serializes calls to onProgress().
 */
class ConsoleReporter {
public:
    /**
     * @param out Destination stream.
     * @param mode Run mode, selects the output policy.
     * @param progressInterval Completions between brute-force progress lines.
     * @param quiet Suppress all output.
     * @param color Emit ANSI color sequences.
     */
    ConsoleReporter(std::ostream& out, RunMode mode, int progressInterval, bool quiet, bool color);

    static void printBanner(std::ostream& out, bool color);

    /**
     * @brief Prints the run header, e.g. the number of brute-force combinations.
     */
    void announce(size_t total);

    void onProgress(const core::ProbeProgress& progress);

private:
    void printBruteForce(const core::ProbeProgress& progress);
    void printResult(const core::ProbeProgress& progress);
    const char* paint(const char* code) const;

    std::ostream& out_;
    RunMode mode_;
    size_t progressInterval_;
    bool quiet_;
    bool color_;
};

} // namespace ftpprobe::app
