#include "gelf/record/record_codec.hpp"

#include <array>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <iomanip>
#include <limits>
#include <sstream>
#include <type_traits>
#include <utility>

#include <simdjson.h>

#include "gelf/record/json_fields.hpp"

namespace gelf::record {

namespace {

// Length of the well-formed UTF-8 sequence starting at text[pos], or 0 if the
// bytes there are not one (overlong, surrogate, past U+10FFFF, truncated).
std::size_t utf8_sequence_length(std::string_view text, std::size_t pos) {
  const auto byte = [&](std::size_t i) {
    return static_cast<unsigned char>(text[pos + i]);
  };
  const auto continuation = [&](std::size_t i) {
    return pos + i < text.size() && (byte(i) & 0xC0) == 0x80;
  };
  const unsigned char lead = byte(0);
  if (lead < 0x80) {
    return 1;
  }
  if (lead >= 0xC2 && lead <= 0xDF) {
    return continuation(1) ? 2 : 0;
  }
  if (lead >= 0xE0 && lead <= 0xEF) {
    if (!continuation(1) || !continuation(2)) {
      return 0;
    }
    if ((lead == 0xE0 && byte(1) < 0xA0) || (lead == 0xED && byte(1) > 0x9F)) {
      return 0;
    }
    return 3;
  }
  if (lead >= 0xF0 && lead <= 0xF4) {
    if (!continuation(1) || !continuation(2) || !continuation(3)) {
      return 0;
    }
    if ((lead == 0xF0 && byte(1) < 0x90) || (lead == 0xF4 && byte(1) > 0x8F)) {
      return 0;
    }
    return 4;
  }
  return 0;
}

void append_escaped(std::string &out, std::string_view text) {
  for (char c : text) {
    switch (c) {
    case '\\':
      out += "\\\\";
      break;
    case '"':
      out += "\\\"";
      break;
    case '\b':
      out += "\\b";
      break;
    case '\f':
      out += "\\f";
      break;
    case '\n':
      out += "\\n";
      break;
    case '\r':
      out += "\\r";
      break;
    case '\t':
      out += "\\t";
      break;
    default:
      if (static_cast<unsigned char>(c) < 0x20) {
        std::ostringstream escaped;
        escaped << "\\u" << std::hex << std::uppercase << std::setw(4)
                << std::setfill('0')
                << static_cast<int>(static_cast<unsigned char>(c));
        out += escaped.str();
      } else {
        out += c;
      }
      break;
    }
  }
}

// Escapes text as JSON string content. Each byte that does not start a
// well-formed UTF-8 sequence becomes U+FFFD so the output always parses.
void append_json_string(std::string &out, std::string_view text) {
  if (simdjson::validate_utf8(text.data(), text.size())) {
    append_escaped(out, text);
    return;
  }
  std::size_t pos = 0;
  while (pos < text.size()) {
    const std::size_t length = utf8_sequence_length(text, pos);
    if (length == 0) {
      out += "\\ufffd";
      ++pos;
      continue;
    }
    append_escaped(out, text.substr(pos, length));
    pos += length;
  }
}

void append_quoted(std::string &out, std::string_view text) {
  out += '"';
  append_json_string(out, text);
  out += '"';
}

// Shortest text that parses back to the same double, in plain notation for
// timestamp-sized magnitudes. Integral values keep a ".0" so they decode as
// doubles again.
std::expected<void, EncodeError> append_double(std::string &out, double value) {
  if (!std::isfinite(value)) {
    return std::unexpected(EncodeError::NonFiniteNumber);
  }
  const double magnitude = std::fabs(value);
  const bool plain = magnitude == 0.0 || (magnitude >= 1e-5 && magnitude < 1e17);
  std::array<char, 64> buffer{};
  auto [end, ec] =
      plain ? std::to_chars(buffer.data(), buffer.data() + buffer.size(), value,
                            std::chars_format::fixed)
            : std::to_chars(buffer.data(), buffer.data() + buffer.size(), value);
  if (ec != std::errc()) {
    return std::unexpected(EncodeError::NonFiniteNumber);
  }
  std::string_view text(buffer.data(), static_cast<std::size_t>(end - buffer.data()));
  out += text;
  if (text.find_first_of(".eE") == std::string_view::npos) {
    out += ".0";
  }
  return {};
}

std::expected<void, EncodeError> append_raw_json(std::string &out, const RawJson &raw) {
  simdjson::dom::parser parser;
  simdjson::padded_string padded(raw.text.data(), raw.text.size());
  if (parser.parse(padded).error()) {
    return std::unexpected(EncodeError::InvalidRawJson);
  }

  std::string minified(raw.text.size(), '\0');
  std::size_t length = 0;
  if (simdjson::minify(raw.text.data(), raw.text.size(), minified.data(), length)) {
    return std::unexpected(EncodeError::InvalidRawJson);
  }
  minified.resize(length);
  out += minified;
  return {};
}

std::expected<void, EncodeError> append_extra_value(std::string &out,
                                                    const ExtraValue &value) {
  return std::visit(
      [&](const auto &val) -> std::expected<void, EncodeError> {
        using T = std::decay_t<decltype(val)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
          out += "null";
        } else if constexpr (std::is_same_v<T, bool>) {
          out += (val ? "true" : "false");
        } else if constexpr (std::is_same_v<T, std::int64_t> ||
                             std::is_same_v<T, std::uint64_t>) {
          out += std::to_string(val);
        } else if constexpr (std::is_same_v<T, double>) {
          return append_double(out, val);
        } else if constexpr (std::is_same_v<T, std::string>) {
          append_quoted(out, val);
        } else if constexpr (std::is_same_v<T, RawJson>) {
          return append_raw_json(out, val);
        }
        return {};
      },
      value);
}

bool is_reserved_key(std::string_view key) {
  static constexpr std::array<std::string_view, 9> fixed{
      FIELD_VERSION,  FIELD_HOST,     FIELD_SHORT_MESSAGE,
      FIELD_FULL_MESSAGE, FIELD_TIMESTAMP, FIELD_LEVEL,
      FIELD_FACILITY, FIELD_FILE,     FIELD_LINE};
  if (key.empty()) {
    return true;
  }
  for (auto name : fixed) {
    if (key == name) {
      return true;
    }
  }
  return false;
}

void append_string_field(std::string &out, std::string_view name,
                         std::string_view value) {
  out += ",\"";
  out += name;
  out += "\":";
  append_quoted(out, value);
}

std::expected<std::string, DecodeError> get_string(simdjson::ondemand::value &value) {
  std::string_view text;
  if (value.get_string().get(text)) {
    return std::unexpected(DecodeError::InvalidField);
  }
  return std::string(text);
}

std::expected<double, DecodeError> get_double(simdjson::ondemand::value &value) {
  simdjson::ondemand::number number;
  if (value.get_number().get(number)) {
    return std::unexpected(DecodeError::InvalidField);
  }
  return number.as_double();
}

// Integral JSON number within [min, max]. A float with no fractional part is
// accepted since some producers write every number as a double.
std::expected<std::int64_t, DecodeError>
get_integral(simdjson::ondemand::value &value, std::int64_t min, std::int64_t max) {
  simdjson::ondemand::number number;
  if (value.get_number().get(number)) {
    return std::unexpected(DecodeError::InvalidField);
  }

  std::int64_t out = 0;
  switch (number.get_number_type()) {
  case simdjson::ondemand::number_type::signed_integer:
    out = number.get_int64();
    break;
  case simdjson::ondemand::number_type::floating_point_number: {
    const double d = number.get_double();
    if (!std::isfinite(d) || std::trunc(d) != d ||
        d < static_cast<double>(min) || d > static_cast<double>(max)) {
      return std::unexpected(DecodeError::InvalidField);
    }
    out = static_cast<std::int64_t>(d);
    break;
  }
  default:
    return std::unexpected(DecodeError::InvalidField);
  }

  if (out < min || out > max) {
    return std::unexpected(DecodeError::InvalidField);
  }
  return out;
}

std::expected<RawJson, DecodeError> get_raw_json(simdjson::ondemand::value &value) {
  std::string_view raw;
  if (value.raw_json().get(raw)) {
    return std::unexpected(DecodeError::InvalidJson);
  }
  std::string minified(raw.size(), '\0');
  std::size_t length = 0;
  if (simdjson::minify(raw.data(), raw.size(), minified.data(), length)) {
    return std::unexpected(DecodeError::InvalidJson);
  }
  minified.resize(length);
  return RawJson{std::move(minified)};
}

std::expected<ExtraValue, DecodeError> get_extra_value(simdjson::ondemand::value &value) {
  simdjson::ondemand::json_type type;
  if (value.type().get(type)) {
    return std::unexpected(DecodeError::InvalidJson);
  }

  switch (type) {
  case simdjson::ondemand::json_type::null:
    return ExtraValue{nullptr};
  case simdjson::ondemand::json_type::boolean: {
    bool flag = false;
    if (value.get_bool().get(flag)) {
      return std::unexpected(DecodeError::InvalidField);
    }
    return ExtraValue{flag};
  }
  case simdjson::ondemand::json_type::number: {
    simdjson::ondemand::number number;
    if (value.get_number().get(number)) {
      return std::unexpected(DecodeError::InvalidField);
    }
    switch (number.get_number_type()) {
    case simdjson::ondemand::number_type::signed_integer:
      return ExtraValue{number.get_int64()};
    case simdjson::ondemand::number_type::unsigned_integer:
      return ExtraValue{number.get_uint64()};
    case simdjson::ondemand::number_type::floating_point_number:
      return ExtraValue{number.get_double()};
    default:
      return std::unexpected(DecodeError::InvalidField);
    }
  }
  case simdjson::ondemand::json_type::string: {
    auto text = get_string(value);
    if (!text) {
      return std::unexpected(text.error());
    }
    return ExtraValue{std::move(*text)};
  }
  case simdjson::ondemand::json_type::array:
  case simdjson::ondemand::json_type::object: {
    auto raw = get_raw_json(value);
    if (!raw) {
      return std::unexpected(raw.error());
    }
    return ExtraValue{std::move(*raw)};
  }
  default:
    return std::unexpected(DecodeError::InvalidJson);
  }
}

std::expected<void, DecodeError> assign(std::string &target,
                                        simdjson::ondemand::value &value) {
  auto text = get_string(value);
  if (!text) {
    return std::unexpected(text.error());
  }
  target = std::move(*text);
  return {};
}

std::expected<void, DecodeError> decode_fixed_field(Record &record, std::string_view key,
                                                    simdjson::ondemand::value &value) {
  if (key == FIELD_VERSION) {
    return assign(record.version, value);
  }
  if (key == FIELD_HOST) {
    return assign(record.host, value);
  }
  if (key == FIELD_SHORT_MESSAGE) {
    return assign(record.short_message, value);
  }
  if (key == FIELD_FULL_MESSAGE) {
    return assign(record.full_message, value);
  }
  if (key == FIELD_FACILITY) {
    return assign(record.facility, value);
  }
  if (key == FIELD_FILE) {
    auto file = get_string(value);
    if (!file) {
      return std::unexpected(file.error());
    }
    record.file = std::move(*file);
    return {};
  }
  if (key == FIELD_TIMESTAMP) {
    auto ts = get_double(value);
    if (!ts) {
      return std::unexpected(ts.error());
    }
    record.timestamp = *ts;
    return {};
  }
  if (key == FIELD_LEVEL) {
    auto level = get_integral(value, std::numeric_limits<std::int32_t>::min(),
                              std::numeric_limits<std::int32_t>::max());
    if (!level) {
      return std::unexpected(level.error());
    }
    record.level = static_cast<std::int32_t>(*level);
    return {};
  }
  if (key == FIELD_LINE) {
    auto line = get_integral(value, std::numeric_limits<std::int64_t>::min(),
                             std::numeric_limits<std::int64_t>::max());
    if (!line) {
      return std::unexpected(line.error());
    }
    record.line = *line;
    return {};
  }
  return {};
}

} // namespace

const char *to_string(EncodeError error) {
  switch (error) {
  case EncodeError::ReservedKey:
    return "extension key is empty or shadows a fixed field";
  case EncodeError::NonFiniteNumber:
    return "number is not finite";
  case EncodeError::InvalidRawJson:
    return "raw extension value is not valid json";
  }
  return "unknown encode error";
}

const char *to_string(DecodeError error) {
  switch (error) {
  case DecodeError::EmptyMessage:
    return "empty message";
  case DecodeError::InvalidJson:
    return "invalid json";
  case DecodeError::NotAnObject:
    return "top-level value is not an object";
  case DecodeError::InvalidField:
    return "field has an unexpected type or range";
  }
  return "unknown decode error";
}

std::expected<std::string, EncodeError> encode(const Record &record) {
  std::string out;
  out.reserve(256 + record.short_message.size() + record.full_message.size());

  out += "{\"";
  out += FIELD_VERSION;
  out += "\":";
  append_quoted(out, record.version);
  append_string_field(out, FIELD_HOST, record.host);
  append_string_field(out, FIELD_SHORT_MESSAGE, record.short_message);
  append_string_field(out, FIELD_FULL_MESSAGE, record.full_message);

  out += ",\"";
  out += FIELD_TIMESTAMP;
  out += "\":";
  if (auto ts = append_double(out, record.timestamp); !ts) {
    return std::unexpected(ts.error());
  }

  out += ",\"";
  out += FIELD_LEVEL;
  out += "\":";
  out += std::to_string(record.level);
  append_string_field(out, FIELD_FACILITY, record.facility);

  if (record.file) {
    append_string_field(out, FIELD_FILE, *record.file);
  }
  if (record.line) {
    out += ",\"";
    out += FIELD_LINE;
    out += "\":";
    out += std::to_string(*record.line);
  }

  for (const auto &[key, value] : record.extra) {
    if (is_reserved_key(key)) {
      return std::unexpected(EncodeError::ReservedKey);
    }
    out += ',';
    append_quoted(out, key);
    out += ':';
    if (auto appended = append_extra_value(out, value); !appended) {
      return std::unexpected(appended.error());
    }
  }

  out += '}';
  return out;
}

std::expected<Record, DecodeError> decode(std::string_view json) {
  if (json.empty()) {
    return std::unexpected(DecodeError::EmptyMessage);
  }

  simdjson::ondemand::parser parser;
  simdjson::padded_string padded(json.data(), json.size());
  simdjson::ondemand::document doc;
  if (parser.iterate(padded).get(doc)) {
    return std::unexpected(DecodeError::InvalidJson);
  }

  simdjson::ondemand::object object;
  if (auto error = doc.get_object().get(object); error) {
    return std::unexpected(error == simdjson::INCORRECT_TYPE ? DecodeError::NotAnObject
                                                             : DecodeError::InvalidJson);
  }

  Record record;
  record.version.clear();
  for (auto field_result : object) {
    simdjson::ondemand::field field;
    if (std::move(field_result).get(field)) {
      return std::unexpected(DecodeError::InvalidJson);
    }
    std::string_view key;
    if (field.unescaped_key().get(key)) {
      return std::unexpected(DecodeError::InvalidJson);
    }

    if (!key.empty() && key.front() == EXTRA_PREFIX) {
      std::string name(key);
      auto value = get_extra_value(field.value());
      if (!value) {
        return std::unexpected(value.error());
      }
      record.extra.insert_or_assign(std::move(name), std::move(*value));
      continue;
    }

    auto decoded = decode_fixed_field(record, key, field.value());
    if (!decoded) {
      return std::unexpected(decoded.error());
    }
  }

  if (!doc.at_end()) {
    return std::unexpected(DecodeError::InvalidJson);
  }
  return record;
}

} // namespace gelf::record
