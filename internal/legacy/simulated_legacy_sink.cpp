#include "simulated_legacy_sink.hpp"

#include <memory>
#include <stdexcept>
#include <thread>

#include "config/config.pb.h"
#include "internal/observability/logging.hpp"

namespace scanhub::legacy {

using observability::IntField;

SimulatedLegacySink::SimulatedLegacySink(std::chrono::milliseconds min_latency, std::chrono::milliseconds max_latency,
                                         double failure_probability, std::uint32_t seed)
    : min_latency_(min_latency), max_latency_(max_latency), failure_probability_(failure_probability), rng_(seed) {
  if (min_latency_ > max_latency_) {
    throw std::invalid_argument("legacy sink min latency exceeds max latency");
  }
  if (failure_probability_ < 0.0 || failure_probability_ > 1.0) {
    throw std::invalid_argument("legacy sink failure probability must be within [0, 1]");
  }
}

std::shared_ptr<SimulatedLegacySink> SimulatedLegacySink::FromConfig(const scanhub::runtime::config::LegacySinkConfig& config) {
  return std::make_shared<SimulatedLegacySink>(std::chrono::milliseconds(config.min_latency_ms()),
                                               std::chrono::milliseconds(config.max_latency_ms()), config.failure_probability());
}

LegacySaveResult SimulatedLegacySink::AttemptSave(int64_t platform, int64_t product) {
  std::chrono::milliseconds latency;
  bool                      fail;
  {
    std::lock_guard                          lock(rng_mutex_);
    std::uniform_int_distribution<long long> latency_dist(min_latency_.count(), max_latency_.count());
    std::bernoulli_distribution              failure_dist(failure_probability_);
    latency = std::chrono::milliseconds(latency_dist(rng_));
    fail    = failure_dist(rng_);
  }

  std::this_thread::sleep_for(latency);

  if (fail) {
    SCANHUB_LOG_DEBUG("legacy save rejected", {IntField("platform", platform), IntField("product", product)});
    return {false, "legacy system rejected the pairing"};
  }

  SCANHUB_LOG_DEBUG("legacy save accepted",
                    {IntField("platform", platform), IntField("product", product), IntField("latency_ms", latency.count())});
  return {true, {}};
}

} // namespace scanhub::legacy
