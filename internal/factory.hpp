#pragma once

#include <grpcpp/grpcpp.h>

#include <cstdint>
#include <functional>
#include <memory>
#include <vector>

#include "config/config.pb.h"
#include "internal/db/api/repository.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/estimator_service.hpp"
#include "internal/service/pipeline_service.hpp"

namespace deliveryiq::factory {

/*
  Application

  Owns all long-lived objects used by the server.
  Everything here lives for the lifetime of the process.
*/
struct Application {
  std::shared_ptr<db::Repository> repository;

  std::shared_ptr<service::EstimatorService> estimator_service;
  std::shared_ptr<service::PipelineService>  pipeline_service;
  std::shared_ptr<service::AdminService>     admin_service;

  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;
};

/*
  Selects and bootstraps the configured backend:
  database.sqlite, database.postgres, or in-memory when neither is set.

  This is the ONLY place allowed to know concrete DB types.
*/
std::shared_ptr<db::Repository> BuildRepository(const deliveryiq::runtime::config::RuntimeConfig& config);

/*
  Composition root. `now_ms` defaults to the wall clock.
*/
Application Build(const deliveryiq::runtime::config::RuntimeConfig& config, std::function<int64_t()> now_ms = {});

Application Build(const deliveryiq::runtime::config::RuntimeConfig& config,
                  std::shared_ptr<db::Repository>                   repository,
                  std::function<int64_t()>                          now_ms = {});

} // namespace deliveryiq::factory
