#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace deliveryiq::db::memory {

namespace {

template <typename Record, typename Keep>
std::vector<Record> Page(const std::map<std::string, Record>& rows, const PageRequest& page, Keep&& keep) {
  const auto          limit = ClampPageSize(page.limit);
  std::vector<Record> out;

  auto it = page.after.empty() ? rows.begin() : rows.upper_bound(page.after);
  for (; it != rows.end() && out.size() < limit; ++it) {
    if (keep(it->second)) {
      out.push_back(it->second);
    }
  }
  return out;
}

template <typename Record>
std::vector<Record> Lookup(const std::map<std::string, Record>& rows, const std::vector<std::string>& ids) {
  std::vector<Record> out;
  out.reserve(std::min(ids.size(), kMaxPageRows));
  for (const auto& id : ids) {
    auto it = rows.find(id);
    if (it != rows.end()) {
      out.push_back(it->second);
    }
  }
  return out;
}

bool Matches(const model::OutcomeRecord& r, const OutcomeFilter& f) {
  if (f.carrier && r.carrier != *f.carrier) return false;
  if (f.carrier_service && r.carrier_service != f.carrier_service) return false;
  if (f.service_bucket && r.service_bucket != *f.service_bucket) return false;
  if (f.zone_bucket && r.zone_bucket != *f.zone_bucket) return false;
  if (f.season_bucket && r.season_bucket != *f.season_bucket) return false;
  if (!f.outcomes.empty() && std::find(f.outcomes.begin(), f.outcomes.end(), r.outcome) == f.outcomes.end()) return false;
  return true;
}

} // namespace

MemoryRepository::MemoryRepository() : committed_(std::make_shared<const State>()) {
}

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Tracking snapshots
// ------------------------------------------------------------------

Result MemoryRepository::UpsertTrackingSnapshot(Transaction& t, const model::TrackingSnapshotRecord& r) {
  if (r.shipment_id.empty()) return Result::Err(ErrorCode::ConstraintViolation, "shipment_id is required");
  TX(t).Mutable().snapshots[r.shipment_id] = r;
  return Result::Ok();
}

std::vector<model::TrackingSnapshotRecord> MemoryRepository::ListInTransitSnapshots(Transaction& t, const PageRequest& page) {
  return Page(TX(t).View().snapshots, page, [](const model::TrackingSnapshotRecord& r) { return r.in_transit_ms.has_value(); });
}

std::vector<model::TrackingSnapshotRecord> MemoryRepository::GetTrackingSnapshots(Transaction& t, const std::vector<std::string>& ids) {
  return Lookup(TX(t).View().snapshots, ids);
}

// ------------------------------------------------------------------
// Claims
// ------------------------------------------------------------------

Result MemoryRepository::UpsertClaim(Transaction& t, const model::ClaimRecord& r) {
  if (r.claim_id.empty()) return Result::Err(ErrorCode::ConstraintViolation, "claim_id is required");
  TX(t).Mutable().claims[r.claim_id] = r;
  return Result::Ok();
}

std::vector<model::ClaimRecord> MemoryRepository::ListClaims(Transaction& t, const PageRequest& page) {
  return Page(TX(t).View().claims, page, [](const model::ClaimRecord&) { return true; });
}

// ------------------------------------------------------------------
// Outcomes
// ------------------------------------------------------------------

Result MemoryRepository::UpsertOutcomes(Transaction& t, const std::vector<model::OutcomeRecord>& records) {
  if (records.empty()) return Result::Ok();

  auto& s = TX(t).Mutable();
  for (const auto& r : records) {
    if (r.shipment_id.empty()) return Result::Err(ErrorCode::ConstraintViolation, "shipment_id is required");
    s.outcomes[r.shipment_id] = r;
  }
  return Result::Ok();
}

std::vector<model::OutcomeRecord> MemoryRepository::GetOutcomes(Transaction& t, const std::vector<std::string>& ids) {
  return Lookup(TX(t).View().outcomes, ids);
}

std::vector<model::OutcomeRecord> MemoryRepository::ListOutcomes(Transaction& t, const OutcomeFilter& filter, const PageRequest& page) {
  return Page(TX(t).View().outcomes, page, [&filter](const model::OutcomeRecord& r) { return Matches(r, filter); });
}

uint64_t MemoryRepository::CountOutcomes(Transaction& t, const OutcomeFilter& filter) {
  const auto& outcomes = TX(t).View().outcomes;
  return static_cast<uint64_t>(
      std::count_if(outcomes.begin(), outcomes.end(), [&filter](const auto& entry) { return Matches(entry.second, filter); }));
}

// ------------------------------------------------------------------
// Survival curves
// ------------------------------------------------------------------

Result MemoryRepository::ReplaceSurvivalCurve(Transaction& t, const model::SurvivalCurveRecord& r) {
  auto&      s   = TX(t).Mutable();
  const auto key = r.key.Canonical();
  s.curves.erase(key);
  s.curves.emplace(key, r);
  return Result::Ok();
}

std::vector<model::SurvivalCurveRecord> MemoryRepository::FindSurvivalCurves(Transaction& t, const CurveFilter& f) {
  std::vector<model::SurvivalCurveRecord> out;
  for (const auto& [_, curve] : TX(t).View().curves) {
    const auto& k = curve.key;
    if (k.carrier != f.carrier || k.carrier_service != f.carrier_service || k.service_bucket != f.service_bucket ||
        k.zone_bucket != f.zone_bucket) {
      continue;
    }
    if (f.season_bucket && k.season_bucket != *f.season_bucket) continue;
    if (curve.sample_size < f.min_sample_size) continue;
    out.push_back(curve);
  }
  return out;
}

std::vector<model::SurvivalCurveRecord> MemoryRepository::ListSurvivalCurves(Transaction& t, const PageRequest& page) {
  return Page(TX(t).View().curves, page, [](const model::SurvivalCurveRecord&) { return true; });
}

} // namespace deliveryiq::db::memory
