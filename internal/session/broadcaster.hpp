#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "connection.hpp"

namespace scanhub::session {

struct DeliveryOutcome {
  std::string connection_id;
  bool        delivered = false;
  std::string error;
};

/*
  Per-recipient result of one fan-out. Failed recipients stay registered;
  the report only records what happened.
*/
struct DeliveryReport {
  std::vector<DeliveryOutcome> outcomes;

  std::size_t Delivered() const;
  std::size_t Failed() const;

  void Append(const DeliveryReport& other);
};

class Broadcaster {
 public:
  // Attempts every recipient in order. Never throws on a recipient failure.
  DeliveryReport SendTo(const std::vector<ConnectionPtr>& recipients, const scanhub::v1::ServerEvent& event) const;
};

} // namespace scanhub::session
