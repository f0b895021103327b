#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_map>

#include "internal/db/model/claim_record.hpp"

namespace deliveryiq::db {
class Repository;
class Transaction;
} // namespace deliveryiq::db

namespace deliveryiq::outcome {

inline constexpr std::string_view kLossIssueType = "Loss";

/*
  Most relevant claim per shipment.

  A Loss claim always replaces a non-loss one. Among Loss claims the most
  recently updated wins, ties go to the claim added last. A non-loss claim
  never replaces an existing entry.
*/
class ClaimsIndex {
 public:
  void Add(const db::model::ClaimRecord& claim);

  // nullptr when the shipment has no claim
  const db::model::ClaimRecord* Find(const std::string& shipment_id) const;

  std::size_t Size() const {
    return by_shipment_.size();
  }

  // Pages through every claim in ascending claim_id order.
  static ClaimsIndex Load(db::Repository& repository, db::Transaction& tx, std::size_t page_size);

 private:
  std::unordered_map<std::string, db::model::ClaimRecord> by_shipment_;
};

} // namespace deliveryiq::outcome
