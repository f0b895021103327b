#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace deliveryiq::db::sql {

/*
  Parameter abstraction.

  Postgres: $1 $2 $3
  SQLite:   ? ? ?

  Both use ordered binding, so one parameter list serves both.
*/

using Param = std::variant<std::nullptr_t, int64_t, double, std::string>;

using Params = std::vector<Param>;

template <typename T>
Param Nullable(const std::optional<T>& value) {
  if (!value) return nullptr;
  if constexpr (std::is_floating_point_v<T>) {
    return static_cast<double>(*value);
  } else if constexpr (std::is_integral_v<T>) {
    return static_cast<int64_t>(*value);
  } else {
    return std::string(*value);
  }
}

} // namespace deliveryiq::db::sql
