#include "outcome_sync.hpp"

#include <string>
#include <unordered_map>
#include <vector>

#include "config/config.pb.h"
#include "internal/db/api/repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/outcome/claims_index.hpp"
#include "internal/util/time.hpp"

namespace deliveryiq::outcome {

using deliveryiq::observability::IntField;
using deliveryiq::observability::StringField;

SyncOptions SyncOptions::FromConfig(const deliveryiq::runtime::config::OutcomeConfig& config) {
  SyncOptions options;
  options.page_size = db::ClampPageSize(config.page_size());
  if (config.has_reevaluate_censored()) {
    options.reevaluate_censored = config.reevaluate_censored();
  }
  if (config.reevaluation_window_days() > 0) {
    options.reevaluation_window_days = config.reevaluation_window_days();
  }
  return options;
}

OutcomeSync::OutcomeSync(std::shared_ptr<db::Repository> repository, OutcomeClassifier classifier, SyncOptions options)
    : repository_(std::move(repository)), classifier_(classifier), options_(options) {
  options_.page_size = db::ClampPageSize(options_.page_size);
}

SyncResult OutcomeSync::Run(int64_t now_ms) {
  deliveryiq::observability::SpanScope span("OutcomeSync.Run");
  SyncResult                           result;

  DELIVERYIQ_LOG_INFO("outcome sync started", {IntField("page_size", static_cast<int64_t>(options_.page_size))});

  ClaimsIndex claims;
  try {
    auto tx = repository_->Begin();
    claims  = ClaimsIndex::Load(*repository_, *tx, options_.page_size);
    tx->Commit();
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    DELIVERYIQ_LOG_ERROR("outcome sync aborted: claims load failed", {StringField("error", ex.what())});
    deliveryiq::observability::Metrics::Instance().RecordUnitError("sync");
    ++result.errors;
    return result;
  }

  DELIVERYIQ_LOG_INFO("claims loaded", {IntField("shipments_with_claims", static_cast<int64_t>(claims.Size()))});

  const int64_t window_ms = options_.reevaluation_window_days * util::kMillisPerDay;

  db::PageRequest page{.after = {}, .limit = options_.page_size};
  while (true) {
    std::vector<db::model::TrackingSnapshotRecord> snapshots;
    std::unique_ptr<db::Transaction>               tx;
    try {
      tx        = repository_->Begin();
      snapshots = repository_->ListInTransitSnapshots(*tx, page);
    } catch (const std::exception& ex) {
      // without the page there is no cursor to continue from
      span.RecordException(ex.what());
      DELIVERYIQ_LOG_ERROR("outcome sync aborted: snapshot page read failed", {StringField("after", page.after), StringField("error", ex.what())});
      deliveryiq::observability::Metrics::Instance().RecordUnitError("sync");
      ++result.errors;
      break;
    }

    if (snapshots.empty()) {
      break;
    }
    result.scanned += snapshots.size();

    try {
      std::vector<std::string> ids;
      ids.reserve(snapshots.size());
      for (const auto& snapshot : snapshots) {
        ids.push_back(snapshot.shipment_id);
      }

      std::unordered_map<std::string, db::model::OutcomeRecord> existing;
      for (auto& record : repository_->GetOutcomes(*tx, ids)) {
        existing.emplace(record.shipment_id, std::move(record));
      }

      std::vector<db::model::OutcomeRecord> writes;
      uint64_t                              added       = 0;
      uint64_t                              reevaluated = 0;
      for (const auto& snapshot : snapshots) {
        auto it = existing.find(snapshot.shipment_id);
        if (it == existing.end()) {
          if (auto record = classifier_.Classify(snapshot, claims.Find(snapshot.shipment_id), now_ms)) {
            writes.push_back(std::move(*record));
            ++added;
          }
          continue;
        }

        const auto& previous = it->second;
        if (!options_.reevaluate_censored || previous.outcome != deliveryiq::v1::OUTCOME_CENSORED) {
          continue;
        }
        if (now_ms - previous.transit_start_ms > window_ms) {
          continue;
        }

        auto record = classifier_.Classify(snapshot, claims.Find(snapshot.shipment_id), now_ms);
        if (record && record->outcome != previous.outcome) {
          writes.push_back(std::move(*record));
          ++reevaluated;
        }
      }

      if (!writes.empty()) {
        db::ThrowIfError(repository_->UpsertOutcomes(*tx, writes), "upsert outcome page");
      }
      tx->Commit();

      result.added += added;
      result.reevaluated += reevaluated;
    } catch (const std::exception& ex) {
      span.RecordException(ex.what());
      DELIVERYIQ_LOG_ERROR("outcome sync page failed",
                           {StringField("after", page.after), StringField("last", snapshots.back().shipment_id), StringField("error", ex.what())});
      deliveryiq::observability::Metrics::Instance().RecordUnitError("sync");
      ++result.errors;
    }

    if (snapshots.size() < page.limit) {
      break;
    }
    page.after = snapshots.back().shipment_id;
  }

  span.SetAttribute("scanned", static_cast<int64_t>(result.scanned));
  span.SetAttribute("added", static_cast<int64_t>(result.added));
  DELIVERYIQ_LOG_INFO("outcome sync finished",
                      {IntField("scanned", static_cast<int64_t>(result.scanned)),
                       IntField("added", static_cast<int64_t>(result.added)),
                       IntField("reevaluated", static_cast<int64_t>(result.reevaluated)),
                       IntField("errors", static_cast<int64_t>(result.errors))});
  return result;
}

} // namespace deliveryiq::outcome
