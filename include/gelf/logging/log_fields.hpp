#pragma once

#include <cstdint>
#include <string>
#include <utility>

#include "gelf/record/json_fields.hpp"
#include "gelf/record/record.hpp"

namespace gelf::logging
{

  // Helper for building record extension fields. Keys are stored with the
  // leading underscore the wire format requires.
  class LogFields
  {
  public:
    void add_string(std::string key, std::string value)
    {
      put(std::move(key), std::move(value));
    }

    void add_int(std::string key, std::int64_t value) { put(std::move(key), value); }

    void add_uint(std::string key, std::uint64_t value) { put(std::move(key), value); }

    void add_double(std::string key, double value) { put(std::move(key), value); }

    void add_bool(std::string key, bool value) { put(std::move(key), value); }

    // Nested array or object, given as JSON text. Validated at encode time.
    void add_json(std::string key, std::string json)
    {
      put(std::move(key), record::RawJson{std::move(json)});
    }

    // True when no fields were added.
    [[nodiscard]] bool empty() const { return fields_.empty(); }
    // Access entries keyed by wire name.
    [[nodiscard]] const record::Extra &entries() const { return fields_; }

  private:
    void put(std::string key, record::ExtraValue value)
    {
      if (key.empty() || key.front() != record::EXTRA_PREFIX)
      {
        key.insert(key.begin(), record::EXTRA_PREFIX);
      }
      fields_.insert_or_assign(std::move(key), std::move(value));
    }

    record::Extra fields_;
  };

} // namespace gelf::logging
