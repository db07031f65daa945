#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <random>

#include "legacy_sink.hpp"

namespace scanhub::runtime::config {
class LegacySinkConfig;
}

namespace scanhub::legacy {

/*
  Stand-in for the remote legacy system: sleeps for a random time inside
  [min_latency, max_latency] and fails with the configured probability.
*/
class SimulatedLegacySink final : public LegacySink {
 public:
  SimulatedLegacySink(std::chrono::milliseconds min_latency, std::chrono::milliseconds max_latency, double failure_probability,
                      std::uint32_t seed = std::random_device{}());

  static std::shared_ptr<SimulatedLegacySink> FromConfig(const scanhub::runtime::config::LegacySinkConfig& config);

  LegacySaveResult AttemptSave(int64_t platform, int64_t product) override;

 private:
  std::chrono::milliseconds min_latency_;
  std::chrono::milliseconds max_latency_;
  double                    failure_probability_;

  std::mutex   rng_mutex_;
  std::mt19937 rng_;
};

} // namespace scanhub::legacy
