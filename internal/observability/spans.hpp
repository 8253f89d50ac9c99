#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace datamarket::runtime::config {
class RuntimeConfig;
}

namespace datamarket::observability {

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

struct OtlpConfig {
  std::string   service_name{"datamarket"};
  std::string   endpoint{};
  OtlpTransport transport{OtlpTransport::kGrpc};
  bool          insecure{true};
  std::uint32_t export_interval_ms{1000};
};

OtlpConfig ToOtlpConfig(const datamarket::runtime::config::RuntimeConfig& config);

bool InitializeTracing(const datamarket::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const datamarket::runtime::config::RuntimeConfig& config);
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
#ifdef DATAMARKET_ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

// direction for RecordEscrowFlow
inline constexpr std::string_view kEscrowHold    = "hold";
inline constexpr std::string_view kEscrowRefund  = "refund";
inline constexpr std::string_view kEscrowRelease = "release";

class Metrics {
 public:
  static Metrics& Instance();

  void RecordRequest(std::string_view operation, bool success);
  void ObserveRequestLatencyMs(std::string_view operation, double latency_ms);
  void RecordEscrowFlow(std::string_view direction, std::uint64_t amount);

 private:
  Metrics();
#ifdef DATAMARKET_ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef DATAMARKET_ENABLE_OTEL
inline bool InitializeTracing(const datamarket::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const datamarket::runtime::config::RuntimeConfig&) {
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

inline void Metrics::RecordRequest(std::string_view, bool) {
}

inline void Metrics::ObserveRequestLatencyMs(std::string_view, double) {
}

inline void Metrics::RecordEscrowFlow(std::string_view, std::uint64_t) {
}
#endif

} // namespace datamarket::observability
