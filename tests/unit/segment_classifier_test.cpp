#include "internal/segment/segment_classifier.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "support/fixtures.hpp"

namespace {

using namespace deliveryiq::segment;
using deliveryiq::testing::UtcMs;

void TestZoneBuckets() {
  assert(ZoneBucket(std::nullopt) == "zone_5");
  assert(ZoneBucket(0) == "zone_5");
  assert(ZoneBucket(-3) == "zone_5");
  assert(ZoneBucket(1) == "zone_1");
  assert(ZoneBucket(8) == "zone_8");
  assert(ZoneBucket(10) == "zone_10");
  assert(ZoneBucket(11) == "international");
  assert(ZoneBucket(45) == "international");

  assert(!IsInternationalZone(std::nullopt));
  assert(!IsInternationalZone(10));
  assert(IsInternationalZone(11));
}

void TestAdjacentZones() {
  assert((AdjacentZoneBuckets("zone_1") == std::vector<std::string>{"zone_2"}));
  assert((AdjacentZoneBuckets("zone_5") == std::vector<std::string>{"zone_4", "zone_6"}));
  assert((AdjacentZoneBuckets("zone_10") == std::vector<std::string>{"zone_9"}));
  assert(AdjacentZoneBuckets("international").empty());
  assert(AdjacentZoneBuckets("zone_").empty());
  assert(AdjacentZoneBuckets("zone_11").empty());
  assert(AdjacentZoneBuckets("zone_3x").empty());
}

void TestServiceBuckets() {
  assert(ServiceBucket(std::nullopt) == "ground");
  assert(ServiceBucket(std::string("UPS Next Day Air")) == "express");
  assert(ServiceBucket(std::string("FedEx Priority Overnight")) == "express");
  assert(ServiceBucket(std::string("UPS 2nd Day Air")) == "ground");
  assert(ServiceBucket(std::string("FedEx 2Day")) == "2day");
  assert(ServiceBucket(std::string("2 Day Select")) == "2day");
  assert(ServiceBucket(std::string("USPS Priority Mail Premium")) == "premium");
  assert(ServiceBucket(std::string("Ground Advantage")) == "ground");
  assert(ServiceBucket(std::string("Media Mail")) == "ground");
  assert(ServiceBucket(std::string("")) == "ground");
}

void TestSeasonBuckets() {
  assert(SeasonBucket(UtcMs(2024, 11, 1)) == "peak");
  assert(SeasonBucket(UtcMs(2024, 12, 31)) == "peak");
  assert(SeasonBucket(UtcMs(2025, 1, 15)) == "peak");
  assert(SeasonBucket(UtcMs(2025, 2, 1)) == "normal");
  assert(SeasonBucket(UtcMs(2024, 10, 31)) == "normal");
  assert(SeasonBucket(UtcMs(2024, 7, 4)) == "normal");
}

void TestRegions() {
  assert(Region(std::string("ca"), std::string("US")) == std::optional<std::string>("west_coast"));
  assert(Region(std::string("CO"), std::nullopt) == std::optional<std::string>("mountain"));
  assert(Region(std::string("IL"), std::string("us")) == std::optional<std::string>("midwest"));
  assert(Region(std::string("TX"), std::nullopt) == std::optional<std::string>("south"));
  assert(Region(std::string("NY"), std::nullopt) == std::optional<std::string>("northeast"));
  assert(Region(std::string("HI"), std::nullopt) == std::optional<std::string>("remote"));
  assert(Region(std::string("ON"), std::string("CA")) == std::optional<std::string>("international"));
  assert(Region(std::nullopt, std::string("GB")) == std::optional<std::string>("international"));
  assert(!Region(std::string("PR"), std::string("US")).has_value());
  assert(!Region(std::nullopt, std::nullopt).has_value());
}

} // namespace

int main() {
  TestZoneBuckets();
  TestAdjacentZones();
  TestServiceBuckets();
  TestSeasonBuckets();
  TestRegions();

  std::cout << "deliveryiq_unit_segment_classifier: pass\n";
  return 0;
}
