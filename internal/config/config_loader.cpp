#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

namespace deliveryiq::config {

using deliveryiq::runtime::config::RuntimeConfig;

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars stay strings ("2024", "true")
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw std::runtime_error("Unsupported YAML node");
  }
}

static RuntimeConfig ParseYaml(const YAML::Node& yaml) {
  RuntimeConfig config;

  // an empty document is a valid all-defaults config
  if (yaml.IsNull()) {
    ConfigLoader::ApplyDefaults(config);
    return config;
  }
  if (!yaml.IsMap()) {
    throw std::runtime_error("Invalid configuration: top level must be a mapping");
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);
  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  ConfigLoader::ApplyDefaults(config);
  ConfigLoader::Validate(config);
  return config;
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }
  return ParseYaml(yaml);
}

RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }
  return ParseYaml(yaml);
}

void ConfigLoader::ApplyDefaults(RuntimeConfig& config) {
  auto* server = config.mutable_server();
  if (server->bind_address().empty()) {
    server->set_bind_address("0.0.0.0:50051");
  }

  if (config.database().has_sqlite() && !config.database().sqlite().has_wal_mode()) {
    config.mutable_database()->mutable_sqlite()->set_wal_mode(true);
  }

  auto* observability = config.mutable_observability();
  if (observability->service_name().empty()) {
    observability->set_service_name("delivery-iq");
  }

  auto* outcomes = config.mutable_outcomes();
  if (outcomes->domestic_too_fresh_days() == 0) outcomes->set_domestic_too_fresh_days(15);
  if (outcomes->international_too_fresh_days() == 0) outcomes->set_international_too_fresh_days(20);
  if (outcomes->lost_timeout_days() == 0) outcomes->set_lost_timeout_days(45);
  if (!outcomes->has_reevaluate_censored()) outcomes->set_reevaluate_censored(true);
  if (outcomes->reevaluation_window_days() == 0) outcomes->set_reevaluation_window_days(60);
  if (outcomes->page_size() == 0) outcomes->set_page_size(1000);

  auto* survival = config.mutable_survival();
  if (survival->lost_handling().empty()) survival->set_lost_handling("censor");
  if (survival->page_size() == 0) survival->set_page_size(1000);

  auto* resolver = config.mutable_resolver();
  if (resolver->min_sample_size() == 0) resolver->set_min_sample_size(100);

  auto* risk = config.mutable_risk_policy();
  if (risk->decay_per_interval() == 0) risk->set_decay_per_interval(0.7);
  if (risk->exception_penalty_per_interval() == 0) risk->set_exception_penalty_per_interval(0.1);
  if (risk->exception_penalty_cap() == 0) risk->set_exception_penalty_cap(0.5);
  if (risk->failed_attempt_factor() == 0) risk->set_failed_attempt_factor(0.85);
  if (risk->probability_floor() == 0) risk->set_probability_floor(0.05);
  if (risk->probability_ceiling() == 0) risk->set_probability_ceiling(0.999);
  if (risk->default_p90_days() == 0) risk->set_default_p90_days(7);
  if (risk->default_p95_days() == 0) risk->set_default_p95_days(10);
  if (risk->default_decay_p95_days() == 0) risk->set_default_decay_p95_days(7);
  if (risk->critical_days() == 0) risk->set_critical_days(15);
  if (risk->elevated_days() == 0) risk->set_elevated_days(8);
  if (risk->no_curve_probability() == 0) risk->set_no_curve_probability(0.95);
  if (risk->no_curve_decay_rate() == 0) risk->set_no_curve_decay_rate(0.5);
  if (risk->no_curve_expected_day() == 0) risk->set_no_curve_expected_day(4);
}

void ConfigLoader::Validate(const RuntimeConfig& config) {
  const auto& lost_handling = config.survival().lost_handling();
  if (lost_handling != "censor" && lost_handling != "retain") {
    throw std::runtime_error("Invalid configuration: survival.lost_handling must be 'censor' or 'retain', got '" + lost_handling + "'");
  }

  if (config.database().has_sqlite() && config.database().sqlite().path().empty()) {
    throw std::runtime_error("Invalid configuration: database.sqlite.path is required");
  }
  if (config.database().has_postgres() && config.database().postgres().connection_uri().empty()) {
    throw std::runtime_error("Invalid configuration: database.postgres.connection_uri is required");
  }

  const auto& risk = config.risk_policy();
  if (risk.probability_floor() < 0 || risk.probability_ceiling() > 1 || risk.probability_floor() > risk.probability_ceiling()) {
    throw std::runtime_error("Invalid configuration: risk_policy probability bounds must satisfy 0 <= floor <= ceiling <= 1");
  }
  if (risk.decay_per_interval() < 0 || risk.decay_per_interval() > 1) {
    throw std::runtime_error("Invalid configuration: risk_policy.decay_per_interval must be within [0, 1]");
  }
}

} // namespace deliveryiq::config
