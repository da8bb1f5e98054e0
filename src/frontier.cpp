#include "bmssp_core/frontier.hpp"

namespace bmssp_core {

void Frontier::batch_prepend(std::span<const std::pair<double, NodeId>> items) {
  for (const auto& [key, v] : items) heap_.emplace(key, v);
}

void Frontier::settle_top() {
  while (!heap_.empty()) {
    auto [key, v] = heap_.top();
    if (ctx_->is_complete(v)) { heap_.pop(); continue; }
    const double d = ctx_->dist[static_cast<std::size_t>(v)];
    if (key > d) {
      // dist improved since insertion
      heap_.pop();
      heap_.emplace(d, v);
      continue;
    }
    return;
  }
}

std::optional<std::pair<double, NodeId>> Frontier::pop_min() {
  settle_top();
  if (heap_.empty()) return std::nullopt;
  auto top = heap_.top();
  heap_.pop();
  return top;
}

std::optional<double> Frontier::peek_min_key() {
  settle_top();
  if (heap_.empty()) return std::nullopt;
  return heap_.top().first;
}

} // namespace bmssp_core
