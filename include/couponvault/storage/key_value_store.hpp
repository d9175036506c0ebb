#pragma once

#include "couponvault/common/result.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace couponvault::storage {

/// String-keyed, string-valued record store. A missing key is a successful empty read.
class IKeyValueStore {
public:
  virtual ~IKeyValueStore() = default;

  [[nodiscard]] virtual common::Result<std::optional<std::string>> get(const std::string &key) = 0;
  [[nodiscard]] virtual common::Status put(const std::string &key, const std::string &value) = 0;
  [[nodiscard]] virtual common::Status remove(const std::string &key) = 0;
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace couponvault::storage
