#include "internal/observability/spans.hpp"

#include "config/config.pb.h"

namespace datamarket::observability {

OtlpConfig ToOtlpConfig(const datamarket::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();

  OtlpConfig otlp_config;
  if (!observability.service_name().empty()) {
    otlp_config.service_name = observability.service_name();
  }
  otlp_config.endpoint = observability.otlp_endpoint();
  otlp_config.transport =
      observability.transport() == datamarket::runtime::config::OTLP_TRANSPORT_HTTP ? OtlpTransport::kHttpProtobuf : OtlpTransport::kGrpc;
  if (observability.metrics_export_interval_ms() > 0) {
    otlp_config.export_interval_ms = observability.metrics_export_interval_ms();
  }
  return otlp_config;
}

} // namespace datamarket::observability
