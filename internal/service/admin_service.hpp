#pragma once

#include "deliveryiq/v1.hpp"
#include "service_context.hpp"

namespace deliveryiq::service {

/*
  Read-only dashboard statistics over outcome records and survival curves.

  Outcome totals come from count queries; curve figures from a cursor scan
  of the curve table.
*/
class AdminService {
 public:
  explicit AdminService(ServiceContext ctx);

  deliveryiq::v1::StatsResponse Stats(const deliveryiq::v1::StatsRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace deliveryiq::service
