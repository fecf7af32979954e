/* @file Response.cpp
 * @brief frame parser for lines read from the host link
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <string>

// salvage headers
#include "protocols/Response.hpp"

using salvage::protocols::Response;
using nlohmann::json;

std::optional<Response> Response::fromWire(const std::string& line) {
  json frame = json::parse(line, nullptr, /*allow_exceptions=*/false);
  if (frame.is_discarded() || !frame.is_object())
    return std::nullopt;

  auto type = frame.find("type");
  if (type == frame.end() || !type->is_string())
    return std::nullopt;

  Response response;
  if (*type == "reply") {
    auto id = frame.find("id");
    if (id == frame.end() || !id->is_number_unsigned())
      return std::nullopt;
    response.kind = Kind::Reply;
    response.id = id->get<std::uint64_t>();
    if (auto fault = frame.find("fault"); fault != frame.end() && !fault->is_null()) {
      if (!fault->is_string())
        return std::nullopt;
      response.fault = fault->get<std::string>();
    }
    if (auto result = frame.find("result"); result != frame.end())
      response.result = *result;
    return response;
  }

  if (*type == "event") {
    auto channel = frame.find("channel");
    if (channel == frame.end() || !channel->is_string())
      return std::nullopt;
    response.kind = Kind::Event;
    response.channel = channel->get<std::string>();
    if (auto args = frame.find("args"); args != frame.end() && !args->is_null()) {
      if (!args->is_array())
        return std::nullopt;
      response.args = *args;
    }
    return response;
  }

  return std::nullopt;
}
