// SPDX-License-Identifier: MIT
#pragma once

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace lspbridge {

/// What the caller must tell the server after a sync decision.
struct sync_action {
  enum class kind : uint8_t { open, change };
  kind what;
  int32_t version;
};

/** @brief Per-file open/version state for textDocument/did* notifications.
 *
 * A record exists for a path once it has been synced.  Its version starts at
 * 0 and goes up by exactly one each time the content fingerprint differs
 * from the last synced one.  Decisions for one path are atomic with respect
 * to each other.
 */
class document_tracker {
 public:
  /// Fast non-cryptographic content hash; only used to detect change.
  static uint64_t fingerprint(std::string_view content);

  /** @brief Record @p content as the current text of @p path.
   *
   * Returns @c open (version 0) on first sight, @c change with the new
   * version if the text differs from the last recorded one, and an empty
   * optional if nothing changed.
   */
  std::optional<sync_action> record(
      const std::string& path, std::string_view content);

  std::optional<int32_t> version(const std::string& path) const;
  std::size_t size() const;

 private:
  struct open_document {
    int32_t version;
    uint64_t fingerprint;
  };

  mutable std::mutex mutex_;
  std::unordered_map<std::string, open_document> documents_;
};

}  // namespace lspbridge
