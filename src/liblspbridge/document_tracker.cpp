// SPDX-License-Identifier: MIT
#include "lspbridge/document_tracker.hpp"

#include <functional>

namespace lspbridge {

uint64_t document_tracker::fingerprint(std::string_view content) {
  return std::hash<std::string_view>{}(content);
}

std::optional<sync_action> document_tracker::record(
    const std::string& path, std::string_view content) {
  const uint64_t fp{fingerprint(content)};

  std::lock_guard lock{mutex_};
  auto [it, inserted] = documents_.try_emplace(path, open_document{0, fp});
  if (inserted) return sync_action{sync_action::kind::open, 0};

  auto& doc = it->second;
  if (doc.fingerprint == fp) return std::nullopt;

  ++doc.version;
  doc.fingerprint = fp;
  return sync_action{sync_action::kind::change, doc.version};
}

std::optional<int32_t> document_tracker::version(const std::string& path) const {
  std::lock_guard lock{mutex_};
  if (auto it = documents_.find(path); it != documents_.end())
    return it->second.version;
  return std::nullopt;
}

std::size_t document_tracker::size() const {
  std::lock_guard lock{mutex_};
  return documents_.size();
}

}  // namespace lspbridge
