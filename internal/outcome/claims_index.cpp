#include "claims_index.hpp"

#include "internal/db/api/repository.hpp"

namespace deliveryiq::outcome {

void ClaimsIndex::Add(const db::model::ClaimRecord& claim) {
  if (claim.shipment_id.empty()) {
    return;
  }

  auto it = by_shipment_.find(claim.shipment_id);
  if (it == by_shipment_.end()) {
    by_shipment_.emplace(claim.shipment_id, claim);
    return;
  }

  if (claim.issue_type != kLossIssueType) {
    return;
  }

  auto& existing = it->second;
  if (existing.issue_type != kLossIssueType || claim.updated_at_ms >= existing.updated_at_ms) {
    existing = claim;
  }
}

const db::model::ClaimRecord* ClaimsIndex::Find(const std::string& shipment_id) const {
  auto it = by_shipment_.find(shipment_id);
  return it == by_shipment_.end() ? nullptr : &it->second;
}

ClaimsIndex ClaimsIndex::Load(db::Repository& repository, db::Transaction& tx, std::size_t page_size) {
  ClaimsIndex index;

  db::PageRequest page{.after = {}, .limit = db::ClampPageSize(page_size)};
  while (true) {
    auto claims = repository.ListClaims(tx, page);
    for (const auto& claim : claims) {
      index.Add(claim);
    }
    if (claims.size() < page.limit) {
      break;
    }
    page.after = claims.back().claim_id;
  }
  return index;
}

} // namespace deliveryiq::outcome
