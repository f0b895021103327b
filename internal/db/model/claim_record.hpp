#pragma once

#include <cstdint>
#include <string>

namespace deliveryiq::db::model {

// Customer care claim against a shipment, written upstream.
struct ClaimRecord {
  std::string claim_id;
  std::string shipment_id;
  std::string status;     // e.g. "Credit Approved", "Resolved"
  std::string issue_type; // e.g. "Loss"
  int64_t     updated_at_ms = 0;
};

} // namespace deliveryiq::db::model
