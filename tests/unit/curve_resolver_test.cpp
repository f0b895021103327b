#include "internal/resolver/curve_resolver.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"

namespace {

using deliveryiq::db::memory::MemoryRepository;
using deliveryiq::model::SegmentKey;
using deliveryiq::resolver::CurveRequest;
using deliveryiq::resolver::CurveResolver;

namespace db    = deliveryiq::db;
namespace model = deliveryiq::db::model;

void Store(db::Repository& repo, const SegmentKey& key, uint64_t sample_size) {
  model::SurvivalCurveRecord curve;
  curve.key             = key;
  curve.sample_size     = sample_size;
  curve.delivered_count = sample_size;
  curve.curve_data      = {{0, 1.0, sample_size, 0, 0}};

  auto tx = repo.Begin();
  db::ThrowIfError(repo.ReplaceSurvivalCurve(*tx, curve), "store curve");
  tx->Commit();
}

CurveRequest UpsGroundPeak() {
  return CurveRequest{
      .carrier         = "UPS",
      .carrier_service = std::string("UPS Ground"),
      .service_bucket  = "ground",
      .zone_bucket     = "zone_4",
      .season_bucket   = "peak",
  };
}

void TestFallsBackLevelByLevel() {
  auto          repo = std::make_shared<MemoryRepository>();
  CurveResolver resolver(repo);
  const auto    request = UpsGroundPeak();

  assert(!resolver.Resolve(request).has_value());

  Store(*repo, {"all", std::nullopt, "all", "zone_4", "normal"}, 500);
  auto resolved = resolver.Resolve(request);
  assert(resolved && resolved->level == 5);
  assert(resolved->curve.key.service_bucket == "all");

  Store(*repo, {"all", std::nullopt, "ground", "zone_4", "normal"}, 150);
  resolved = resolver.Resolve(request);
  assert(resolved && resolved->level == 4);

  Store(*repo, {"UPS", std::nullopt, "ground", "zone_4", "normal"}, 120);
  resolved = resolver.Resolve(request);
  assert(resolved && resolved->level == 3);
  assert(resolved->curve.key.carrier == "UPS");
  assert(!resolved->curve.key.carrier_service.has_value());

  Store(*repo, {"UPS", std::string("UPS Ground"), "ground", "zone_4", "normal"}, 200);
  resolved = resolver.Resolve(request);
  assert(resolved && resolved->level == 2);

  // below the sample threshold, so level 1 is passed over
  Store(*repo, {"UPS", std::string("UPS Ground"), "ground", "zone_4", "peak"}, 99);
  resolved = resolver.Resolve(request);
  assert(resolved && resolved->level == 2);
  assert(resolved->curve.key.season_bucket == "normal");

  Store(*repo, {"UPS", std::string("UPS Ground"), "ground", "zone_4", "peak"}, 100);
  resolved = resolver.Resolve(request);
  assert(resolved && resolved->level == 1);
  assert(resolved->curve.sample_size == 100);
}

void TestRequestWithoutServiceSkipsExactLevels() {
  auto repo = std::make_shared<MemoryRepository>();
  Store(*repo, {"UPS", std::string("UPS Ground"), "ground", "zone_4", "peak"}, 900);
  Store(*repo, {"UPS", std::nullopt, "ground", "zone_4", "normal"}, 300);

  CurveResolver resolver(repo);
  auto          request = UpsGroundPeak();
  request.carrier_service.reset();

  const auto resolved = resolver.Resolve(request);
  assert(resolved && resolved->level == 3);
  assert(resolved->curve.sample_size == 300);
}

void TestSeasonMatchBeatsLargerSample() {
  auto repo = std::make_shared<MemoryRepository>();
  Store(*repo, {"UPS", std::nullopt, "ground", "zone_4", "normal"}, 400);
  Store(*repo, {"UPS", std::nullopt, "ground", "zone_4", "peak"}, 110);

  CurveResolver resolver(repo);
  auto          request = UpsGroundPeak();

  auto resolved = resolver.Resolve(request);
  assert(resolved && resolved->level == 3);
  assert(resolved->curve.key.season_bucket == "peak");

  request.season_bucket = "shoulder";
  resolved              = resolver.Resolve(request);
  assert(resolved && resolved->curve.sample_size == 400);
}

void TestNeverCrossesZoneOrServiceBucket() {
  auto repo = std::make_shared<MemoryRepository>();
  Store(*repo, {"UPS", std::nullopt, "ground", "zone_5", "peak"}, 1000);
  Store(*repo, {"all", std::nullopt, "express", "zone_4", "peak"}, 1000);

  CurveResolver resolver(repo);
  assert(!resolver.Resolve(UpsGroundPeak()).has_value());
}

void TestMinimumSampleSizeIsConfigurable() {
  auto repo = std::make_shared<MemoryRepository>();
  Store(*repo, {"UPS", std::string("UPS Ground"), "ground", "zone_4", "peak"}, 40);

  CurveResolver resolver(repo);
  auto          request = UpsGroundPeak();
  assert(!resolver.Resolve(request).has_value());

  request.min_sample_size = 30;
  const auto resolved     = resolver.Resolve(request);
  assert(resolved && resolved->level == 1);
}

} // namespace

int main() {
  TestFallsBackLevelByLevel();
  TestRequestWithoutServiceSkipsExactLevels();
  TestSeasonMatchBeatsLargerSample();
  TestNeverCrossesZoneOrServiceBucket();
  TestMinimumSampleSizeIsConfigurable();

  std::cout << "deliveryiq_unit_curve_resolver: pass\n";
  return 0;
}
