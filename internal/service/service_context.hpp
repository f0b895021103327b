#pragma once

#include <cstdint>
#include <functional>
#include <memory>

namespace deliveryiq::db {
class Repository;
}
namespace deliveryiq::outcome {
class OutcomeSync;
}
namespace deliveryiq::survival {
class CurveEngine;
}
namespace deliveryiq::probability {
class ProbabilityEstimator;
}

namespace deliveryiq::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<deliveryiq::db::Repository>                repository;
  std::shared_ptr<deliveryiq::outcome::OutcomeSync>          outcome_sync;
  std::shared_ptr<deliveryiq::survival::CurveEngine>         curve_engine;
  std::shared_ptr<deliveryiq::probability::ProbabilityEstimator> estimator;

  // unix epoch ms; tests pin it
  std::function<int64_t()> now_ms;
};

} // namespace deliveryiq::service
