#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>

#include "internal/outcome/outcome_classifier.hpp"

namespace deliveryiq::db {
class Repository;
}

namespace deliveryiq::runtime::config {
class OutcomeConfig;
}

namespace deliveryiq::outcome {

struct SyncOptions {
  std::size_t page_size                = 1000;
  bool        reevaluate_censored      = true;
  int64_t     reevaluation_window_days = 60;

  static SyncOptions FromConfig(const deliveryiq::runtime::config::OutcomeConfig& config);
};

struct SyncResult {
  uint64_t scanned     = 0;
  uint64_t added       = 0;
  uint64_t reevaluated = 0;
  uint64_t errors      = 0;
};

/*
  Incremental outcome sync.

  Pages through in-transit snapshots by ascending shipment_id and writes an
  outcome record for every shipment that has none yet. Censored records
  whose transit started inside the re-evaluation window are classified
  again and rewritten when the label changed.

  Each page is one transaction. A failed page is logged and counted and
  the job moves on to the next page.
*/
class OutcomeSync {
 public:
  OutcomeSync(std::shared_ptr<db::Repository> repository, OutcomeClassifier classifier, SyncOptions options);

  SyncResult Run(int64_t now_ms);

 private:
  std::shared_ptr<db::Repository> repository_;
  OutcomeClassifier               classifier_;
  SyncOptions                     options_;
};

} // namespace deliveryiq::outcome
