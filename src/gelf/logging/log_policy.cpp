#include "gelf/logging/log_policy.hpp"

namespace gelf::logging
{

  std::optional<DropPolicy> parse_drop_policy(std::string_view text)
  {
    if (text == "drop_oldest")
    {
      return DropPolicy::DropOldest;
    }
    if (text == "drop_newest")
    {
      return DropPolicy::DropNewest;
    }
    return std::nullopt;
  }

} // namespace gelf::logging
