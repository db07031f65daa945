#include "broadcaster.hpp"

#include <algorithm>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace scanhub::session {

namespace {

const char* EventName(const scanhub::v1::ServerEvent& event) {
  switch (event.kind_case()) {
    case scanhub::v1::ServerEvent::kRegistered:
      return "registered";
    case scanhub::v1::ServerEvent::kProducerConnected:
      return "producer_connected";
    case scanhub::v1::ServerEvent::kProducerDisconnected:
      return "producer_disconnected";
    case scanhub::v1::ServerEvent::kPlatformChanged:
      return "platform_changed";
    case scanhub::v1::ServerEvent::kNewPairing:
      return "new_pairing";
    case scanhub::v1::ServerEvent::kProductMoved:
      return "product_moved";
    default:
      return "unknown";
  }
}

} // namespace

std::size_t DeliveryReport::Delivered() const {
  return static_cast<std::size_t>(std::count_if(outcomes.begin(), outcomes.end(), [](const auto& o) { return o.delivered; }));
}

std::size_t DeliveryReport::Failed() const {
  return outcomes.size() - Delivered();
}

void DeliveryReport::Append(const DeliveryReport& other) {
  outcomes.insert(outcomes.end(), other.outcomes.begin(), other.outcomes.end());
}

DeliveryReport Broadcaster::SendTo(const std::vector<ConnectionPtr>& recipients, const scanhub::v1::ServerEvent& event) const {
  DeliveryReport report;
  report.outcomes.reserve(recipients.size());

  for (const auto& connection : recipients) {
    if (!connection) {
      continue;
    }

    DeliveryOutcome outcome;
    outcome.connection_id = connection->Id();
    try {
      connection->Send(event);
      outcome.delivered = true;
    } catch (const std::exception& e) {
      outcome.error = e.what();
      SCANHUB_LOG_WARN("event delivery failed", {observability::StringField("event", EventName(event)),
                                                 observability::StringField("connection", outcome.connection_id),
                                                 observability::StringField("error", outcome.error)});
    }

    observability::Metrics::Instance().RecordDelivery(outcome.delivered);
    report.outcomes.push_back(std::move(outcome));
  }

  return report;
}

} // namespace scanhub::session
