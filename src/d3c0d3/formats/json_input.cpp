#include "json_input.hpp"

#include <redlog.hpp>

#include "d3c0d3/util/value_formatter.hpp"

namespace d3c0d3 {

namespace {

constexpr size_t k_max_description_length = 256;

} // namespace

std::string input_traits<nlohmann::json>::describe(const nlohmann::json& input) {
  // replace invalid utf-8 instead of throwing from dump
  std::string text = input.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
  return util::value_formatter::truncate(std::move(text), k_max_description_length);
}

value to_value(const nlohmann::json& document) {
  switch (document.type()) {
  case nlohmann::json::value_t::null:
  case nlohmann::json::value_t::discarded:
    return value();
  case nlohmann::json::value_t::boolean:
    return value(document.get<bool>());
  case nlohmann::json::value_t::number_integer:
    return value(document.get<int64_t>());
  case nlohmann::json::value_t::number_unsigned:
    return value(document.get<uint64_t>());
  case nlohmann::json::value_t::number_float:
    return value(document.get<double>());
  case nlohmann::json::value_t::string:
    return value(document.get<std::string>());
  case nlohmann::json::value_t::array: {
    value::sequence_type items;
    items.reserve(document.size());
    for (const auto& element : document) {
      items.push_back(to_value(element));
    }
    return value(std::move(items));
  }
  case nlohmann::json::value_t::object: {
    value::mapping_type entries;
    entries.reserve(document.size());
    for (const auto& [key, element] : document.items()) {
      entries.emplace_back(key, to_value(element));
    }
    return value(std::move(entries));
  }
  case nlohmann::json::value_t::binary: {
    value::sequence_type bytes;
    for (auto byte : document.get_binary()) {
      bytes.emplace_back(static_cast<int64_t>(byte));
    }
    return value(std::move(bytes));
  }
  }
  return value();
}

result<value> parse_value(std::string_view text) {
  auto log = redlog::get_logger("d3c0d3.json");

  try {
    auto document = nlohmann::json::parse(text.begin(), text.end());
    return ok_result(to_value(document));
  } catch (const nlohmann::json::parse_error& e) {
    log.dbg("failed to parse json", redlog::field("error", e.what()), redlog::field("size", text.size()));
    return error_result<value>(std::string("invalid json: ") + e.what());
  }
}

} // namespace d3c0d3
