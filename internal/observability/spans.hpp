#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace scanhub::runtime::config {
class RuntimeConfig;
}

namespace scanhub::observability {

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

struct OtlpConfig {
  std::string   service_name{"scanhub"};
  std::string   endpoint{};
  OtlpTransport transport{OtlpTransport::kGrpc};
  bool          insecure{true};
};

bool InitializeTracing(const scanhub::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const scanhub::runtime::config::RuntimeConfig& config);
void ShutdownTracing();
void ShutdownMetrics();

class SpanScope {
 public:
  explicit SpanScope(std::string_view name);
  ~SpanScope();

  SpanScope(const SpanScope&)            = delete;
  SpanScope& operator=(const SpanScope&) = delete;

  SpanScope(SpanScope&&) noexcept;
  SpanScope& operator=(SpanScope&&) noexcept;

  void SetAttribute(std::string_view key, std::string_view value);
  void SetAttribute(std::string_view key, std::int64_t value);
  void AddEvent(std::string_view name);
  void RecordException(std::string_view description);

 private:
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

/*
  Process-wide instruments. Every method is a no-op until InitializeMetrics
  installs a meter provider (or when built without ENABLE_OTEL).
*/
class Metrics {
 public:
  static Metrics& Instance();

  void RecordPairing(bool overwrite);
  void RecordDelivery(bool delivered);
  void RecordReconciliation(std::string_view outcome);
  void ObserveReconciliationMs(double duration_ms);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const scanhub::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const scanhub::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownTracing() {
}

inline void ShutdownMetrics() {
}

inline SpanScope::SpanScope(std::string_view) {
}

inline SpanScope::~SpanScope() {
}

inline SpanScope::SpanScope(SpanScope&&) noexcept = default;

inline SpanScope& SpanScope::operator=(SpanScope&&) noexcept = default;

inline void SpanScope::SetAttribute(std::string_view, std::string_view) {
}

inline void SpanScope::SetAttribute(std::string_view, std::int64_t) {
}

inline void SpanScope::AddEvent(std::string_view) {
}

inline void SpanScope::RecordException(std::string_view) {
}

inline Metrics::Metrics() {
}

inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

inline void Metrics::RecordPairing(bool) {
}

inline void Metrics::RecordDelivery(bool) {
}

inline void Metrics::RecordReconciliation(std::string_view) {
}

inline void Metrics::ObserveReconciliationMs(double) {
}
#endif

} // namespace scanhub::observability
