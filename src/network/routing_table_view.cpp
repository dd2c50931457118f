// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/routing_table_view.hpp"

#include "util/logging.hpp"

#include <cassert>
#include <utility>

namespace shardnet {
namespace network {

const char* ToString(FindRouteError error) {
  switch (error) {
  case FindRouteError::PeerUnreachable:
    return "PeerUnreachable";
  case FindRouteError::RouteBackNotFound:
    return "RouteBackNotFound";
  }
  return "Unknown";
}

RoutingTableView::RoutingTableView(const util::Clock& clock, const RoutingConfig& config)
    : clock_(clock),
      next_hops_(std::make_shared<const NextHopTable>()),
      route_back_(config.route_back_capacity, config.route_back_ttl),
      last_routed_(config.last_routed_cache_size) {}

void RoutingTableView::Update(std::shared_ptr<const NextHopTable> next_hops) {
  if (!next_hops) {
    next_hops = std::make_shared<const NextHopTable>();
  }

  size_t empty_entries = 0;
  for (const auto& [peer, hops] : *next_hops) {
    if (hops.empty()) {
      empty_entries++;
    }
  }
  assert(empty_entries == 0 && "next-hop table must not contain empty hop lists");

  if (empty_entries > 0) {
    LOG_NET_ERROR("RoutingTableView: dropping {} destinations with empty hop lists", empty_entries);
    auto filtered = std::make_shared<NextHopTable>();
    filtered->reserve(next_hops->size() - empty_entries);
    for (const auto& [peer, hops] : *next_hops) {
      if (!hops.empty()) {
        filtered->emplace(peer, hops);
      }
    }
    next_hops = std::move(filtered);
  }

  LOG_NET_DEBUG("RoutingTableView: installed next-hop table with {} destinations", next_hops->size());

  // Swap under the lock; the old snapshot is released outside it
  std::shared_ptr<const NextHopTable> old;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    old = std::exchange(next_hops_, std::move(next_hops));
  }
}

size_t RoutingTableView::ReachablePeers() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return next_hops_->size();
}

size_t RoutingTableView::CountNextHops(const PeerId& peer_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = next_hops_->find(peer_id);
  return it == next_hops_->end() ? 0 : it->second.size();
}

std::optional<std::vector<PeerId>> RoutingTableView::ViewRoute(const PeerId& peer_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = next_hops_->find(peer_id);
  if (it == next_hops_->end()) {
    return std::nullopt;
  }
  return it->second;
}

FindRouteResult RoutingTableView::FindRouteFromPeerId(const PeerId& peer_id) {
  auto it = next_hops_->find(peer_id);
  if (it == next_hops_->end() || it->second.empty()) {
    return FindRouteResult::Err(FindRouteError::PeerUnreachable);
  }

  // Least recently routed wins; a neighbor never routed to beats all others.
  // Strict comparison keeps the first candidate on ties.
  const PeerId* best = nullptr;
  std::optional<uint64_t> best_last;
  for (const PeerId& candidate : it->second) {
    const uint64_t* last = last_routed_.get(candidate);
    if (!last) {
      best = &candidate;
      best_last.reset();
      break;
    }
    if (!best || *last < *best_last) {
      best = &candidate;
      best_last = *last;
    }
  }

  last_routed_.put(*best, find_route_calls_);
  find_route_calls_++;
  return FindRouteResult::Ok(*best);
}

FindRouteResult RoutingTableView::FindRoute(const PeerIdOrHash& target) {
  std::lock_guard<std::mutex> lock(mutex_);

  if (const auto* peer_id = std::get_if<PeerId>(&target)) {
    auto result = FindRouteFromPeerId(*peer_id);
    if (result.ok()) {
      LOG_NET_TRACE("FindRoute: peer {} via {}", peer_id->ToString(), result.next_hop->ToString());
    } else {
      LOG_NET_TRACE("FindRoute: peer {} unreachable", peer_id->ToString());
    }
    return result;
  }

  const auto& hash = std::get<CryptoHash>(target);
  auto previous_hop = route_back_.Remove(clock_.Now(), hash);
  if (!previous_hop) {
    LOG_NET_TRACE("FindRoute: no route back for {}", hash.ToString());
    return FindRouteResult::Err(FindRouteError::RouteBackNotFound);
  }
  return FindRouteResult::Ok(*previous_hop);
}

void RoutingTableView::AddRouteBack(const CryptoHash& hash, const PeerId& previous_hop) {
  std::lock_guard<std::mutex> lock(mutex_);
  route_back_.Insert(clock_.Now(), hash, previous_hop);
}

bool RoutingTableView::CompareRouteBack(const CryptoHash& hash, const PeerId& peer_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto previous_hop = route_back_.Get(clock_.Now(), hash);
  return previous_hop && *previous_hop == peer_id;
}

RoutingTableInfo RoutingTableView::Info() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return RoutingTableInfo{next_hops_};
}

size_t RoutingTableView::RouteBackSize() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return route_back_.Size();
}

}  // namespace network
}  // namespace shardnet
