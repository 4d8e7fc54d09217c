// SPDX-License-Identifier: MIT
#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <span>

#include "lspbridge/client.hpp"
#include "lspbridge/jsonrpc.hpp"

namespace lspbridge {

namespace fs = std::filesystem;

struct cli_options {
  std::optional<fs::path> lspmux{};
  std::optional<fs::path> server_path{};
  std::optional<fs::path> workspace_root{};
  double request_timeout{30.0};
  std::size_t max_message_size{default_max_message_size};
};

// Parse the command line into loglevel and opts.  Returns an exit code
// if the program should stop right away (--help, bad flags).
std::optional<int> parse_options(
    std::span<char*> args, int& loglevel, cli_options& opts);

// Flag, then environment, then the conventional install location.
fs::path discover_lspmux(const cli_options& opts);
fs::path discover_rust_analyzer(const cli_options& opts);
fs::path discover_workspace_root(const cli_options& opts);

// Sidecar invocation: <lspmux> client --server-path <rust-analyzer>
client_options make_client_options(const cli_options& opts);

}  // namespace lspbridge
