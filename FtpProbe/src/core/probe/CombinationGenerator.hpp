/**
 * @file CombinationGenerator.hpp
 * @brief Descriptor sources for bulk and brute-force runs.
 */

#pragma once

#include "core/services/IProbeScheduler.hpp"
#include "core/types/BruteForceSpec.hpp"

#include <cstddef>
#include <optional>
#include <utility>
#include <vector>

namespace ftpprobe::core {

/**
 * @brief Lazily expands a BruteForceSpec into probe descriptors.
 *
 * Descriptors are produced port by port; within a port, username by
 * username; within a username, password by password. In combo mode each
 * fixed pair is crossed with the ports only. Nothing beyond the current
 * position is materialized.
 *
 * To restart the sequence, construct a new generator.
 */
class CombinationGenerator : public IDescriptorSource {
public:
    /**
     * @brief Constructs a generator for the given spec.
     * @param spec Combination space. An empty port list means the protocol default.
     */
    explicit CombinationGenerator(BruteForceSpec spec);

    std::optional<ProbeDescriptor> next() override;

    /**
     * @brief |ports| x |usernames| x |passwords|, or |ports| x |combos| in combo mode.
     */
    size_t totalCount() const override;

    /**
     * @brief Ports the generator iterates over, after defaulting.
     */
    const std::vector<uint16_t>& ports() const { return spec_.ports; }

private:
    size_t credentialsPerPort() const;
    Credential credentialAt(size_t index) const;

    BruteForceSpec spec_;
    size_t portIndex_{0};
    size_t credentialIndex_{0};
};

/**
 * @brief Descriptor source over an already materialized list.
 *
 * Used for single-target and bulk runs, where the endpoint list is small.
 */
class DescriptorList : public IDescriptorSource {
public:
    explicit DescriptorList(std::vector<ProbeDescriptor> descriptors)
        : descriptors_(std::move(descriptors)) {}

    std::optional<ProbeDescriptor> next() override {
        if (position_ >= descriptors_.size()) {
            return std::nullopt;
        }
        return descriptors_[position_++];
    }

    size_t totalCount() const override { return descriptors_.size(); }

private:
    std::vector<ProbeDescriptor> descriptors_;
    size_t position_{0};
};

} // namespace ftpprobe::core
