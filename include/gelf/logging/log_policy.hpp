#pragma once

#include <optional>
#include <string_view>

namespace gelf::logging
{

  // What AsyncJsonLogger discards when its queue is full.
  enum class DropPolicy
  {
    DropOldest,
    DropNewest
  };

  // Parse "drop_oldest" / "drop_newest".
  [[nodiscard]] std::optional<DropPolicy> parse_drop_policy(std::string_view text);

} // namespace gelf::logging
