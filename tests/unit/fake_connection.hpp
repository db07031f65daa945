#pragma once

#include <algorithm>
#include <cstddef>
#include <mutex>
#include <string>
#include <vector>

#include "internal/session/connection.hpp"
#include "internal/util/errors.hpp"
#include "scanhub/v1/session.pb.h"

namespace scanhub::testing {

// Records every delivered event; can be switched to fail deliveries.
class FakeConnection final : public scanhub::session::Connection {
 public:
  explicit FakeConnection(std::string id, bool failing = false) : id_(std::move(id)), failing_(failing) {
  }

  const std::string& Id() const override {
    return id_;
  }

  void Send(const scanhub::v1::ServerEvent& event) override {
    std::lock_guard lock(mutex_);
    if (failing_) {
      throw scanhub::util::DeliveryFailed("fake connection " + id_ + " refuses delivery");
    }
    events_.push_back(event);
  }

  void SetFailing(bool failing) {
    std::lock_guard lock(mutex_);
    failing_ = failing;
  }

  std::vector<scanhub::v1::ServerEvent> Events() const {
    std::lock_guard lock(mutex_);
    return events_;
  }

  std::size_t Count(scanhub::v1::ServerEvent::KindCase kind) const {
    std::lock_guard lock(mutex_);
    return static_cast<std::size_t>(
        std::count_if(events_.begin(), events_.end(), [kind](const auto& e) { return e.kind_case() == kind; }));
  }

  std::size_t Total() const {
    std::lock_guard lock(mutex_);
    return events_.size();
  }

  void Clear() {
    std::lock_guard lock(mutex_);
    events_.clear();
  }

 private:
  std::string id_;

  mutable std::mutex                    mutex_;
  bool                                  failing_ = false;
  std::vector<scanhub::v1::ServerEvent> events_;
};

} // namespace scanhub::testing
