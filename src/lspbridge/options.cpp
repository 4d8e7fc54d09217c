// SPDX-License-Identifier: MIT
#include "options.hpp"

#include <CLI/CLI.hpp>
#include <chrono>
#include <cstdlib>
#include <string>

#include "logger.hpp"

namespace lspbridge {

namespace {

std::optional<std::string> env(const char* name) {
  const char* value = std::getenv(name);
  if (!value || !*value) return std::nullopt;
  return std::string{value};
}

fs::path home_dir() { return env("HOME").value_or(""); }

}  // namespace

std::optional<int> parse_options(
    std::span<char*> args, int& loglevel, cli_options& opts) {
  CLI::App app{"MCP server exposing rust-analyzer through lspmux"};

  app.set_version_flag("--version", std::string{version});
  app.add_option(
      "--lspmux", opts.lspmux,
      "lspmux binary (default: $CARGO_HOME/bin/lspmux)");
  app.add_option(
      "--server-path", opts.server_path,
      "rust-analyzer binary handed to lspmux (default: $RUST_ANALYZER_PATH)");
  app.add_option(
      "--workspace-root", opts.workspace_root,
      "Workspace root (default: $WORKSPACE_ROOT or the current directory)");
  app.add_option(
      "--request-timeout", opts.request_timeout,
      "Seconds to wait for each LSP response")
    ->check(CLI::Range(0.001, 86400.0))
    ->capture_default_str();
  app.add_option(
      "--max-message-size", opts.max_message_size,
      "Largest accepted message body in bytes")
    ->check(CLI::PositiveNumber)
    ->capture_default_str();
  app.add_option(
      "-d, --debug",
      loglevel,
      "Debug log level (2=WARNING, 3=INFO, 4=DEBUG, 5=TRACE)")
    ->check(CLI::Range(0, 5))
    ->capture_default_str();

  try {
    app.parse(static_cast<int>(args.size()), args.data());
  } catch (const CLI::ParseError& e) {
    return app.exit(e);
  }

  return std::nullopt;
}

fs::path discover_lspmux(const cli_options& opts) {
  if (opts.lspmux) return *opts.lspmux;
  fs::path cargo_home{env("CARGO_HOME").value_or((home_dir() / ".cargo").string())};
  return cargo_home / "bin" / "lspmux";
}

fs::path discover_rust_analyzer(const cli_options& opts) {
  if (opts.server_path) return *opts.server_path;
  if (auto ra = env("RUST_ANALYZER_PATH")) return *ra;
  fs::path data_home{
    env("XDG_DATA_HOME").value_or((home_dir() / ".local" / "share").string())};
  return data_home / "lspmux-rust-analyzer" / "current" / "rust-analyzer";
}

fs::path discover_workspace_root(const cli_options& opts) {
  fs::path root{};
  if (opts.workspace_root) {
    root = *opts.workspace_root;
  } else if (auto ws = env("WORKSPACE_ROOT")) {
    root = *ws;
  } else {
    root = fs::current_path();
  }
  return fs::absolute(root);
}

client_options make_client_options(const cli_options& opts) {
  auto lspmux = discover_lspmux(opts);
  auto rust_analyzer = discover_rust_analyzer(opts);
  auto root = discover_workspace_root(opts);

  LOG_INFO("lspmux binary: {}", lspmux);
  LOG_INFO("rust-analyzer binary: {}", rust_analyzer);
  LOG_INFO("workspace root: {}", root);

  return client_options{
    .program = lspmux,
    .args = {"client", "--server-path", rust_analyzer.string()},
    .workspace_root = root,
    .request_timeout = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::duration<double>(opts.request_timeout)),
    .max_message_size = opts.max_message_size,
  };
}

}  // namespace lspbridge
