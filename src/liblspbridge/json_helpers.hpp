// SPDX-License-Identifier: MIT
#pragma once

#include <boost/json.hpp>
#include <optional>
#include <string_view>
#include <utility>

namespace lspbridge {

namespace json = boost::json;

// JSONRPC error codes
constexpr int PARSE_ERROR{-32700};
constexpr int INVALID_REQUEST{-32600};
constexpr int METHOD_NOT_FOUND{-32601};
constexpr int INVALID_PARAMS{-32602};
constexpr int INTERNAL_ERROR{-32603};

inline json::object make_result(const json::value& id, json::value result) {
  json::object msg{};
  msg["jsonrpc"] = "2.0";
  msg["id"] = id;
  msg["result"] = std::move(result);
  return msg;
}

inline json::object make_jsonrpc_error(
    const json::value& id, int code, std::string_view message,
    std::optional<json::value> data = std::nullopt) {
  json::object err{};
  err["code"] = code;
  err["message"] = message;
  if (data) err["data"] = std::move(*data);
  json::object msg{};
  msg["jsonrpc"] = "2.0";
  msg["id"] = id;
  msg["error"] = std::move(err);
  return msg;
}

}  // namespace lspbridge
