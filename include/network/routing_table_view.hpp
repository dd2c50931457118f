// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 RoutingTableView - next-hop selection for routed messages

 Purpose
 - Hold the current NextHopTable snapshot (computed elsewhere from the network
   graph) and answer "which directly connected peer do I forward this to?"
 - Remember where hash-addressed requests came from, so replies retrace the
   exact inverse path (RouteBackCache).

 Next-hop selection
 - Among the equal-cost neighbors for a destination, pick the one routed to
   least recently. A neighbor never routed to ranks first; ties keep the
   order of the snapshot's hop list.
 - The recency counter is global across destinations, so load is spread over
   all neighbors jointly rather than per destination.

 Thread-safety
 - One mutex guards the snapshot pointer, the route-back cache, the call
   counter and the recency index. Snapshots are immutable and shared;
   readers can keep one after the lock is released.
*/

#include "network/route_back_cache.hpp"
#include "network/routing_config.hpp"
#include "network/types.hpp"
#include "util/clock.hpp"
#include "util/lru_cache.hpp"

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace shardnet {
namespace network {

enum class FindRouteError {
  PeerUnreachable,    // destination not in the table; drop, may succeed after a topology update
  RouteBackNotFound,  // no live route-back entry; late or duplicate reply
};

const char* ToString(FindRouteError error);

struct FindRouteResult {
  std::optional<PeerId> next_hop;
  FindRouteError error{FindRouteError::PeerUnreachable};  // meaningful only if !ok()

  static FindRouteResult Ok(const PeerId& peer) { return FindRouteResult{peer, {}}; }
  static FindRouteResult Err(FindRouteError e) { return FindRouteResult{std::nullopt, e}; }

  bool ok() const { return next_hop.has_value(); }
};

struct RoutingTableInfo {
  std::shared_ptr<const NextHopTable> next_hops;
};

class RoutingTableView {
public:
  // clock must outlive the view.
  explicit RoutingTableView(const util::Clock& clock, const RoutingConfig& config = RoutingConfig{});

  RoutingTableView(const RoutingTableView&) = delete;
  RoutingTableView& operator=(const RoutingTableView&) = delete;

  // Install a new snapshot. nullptr installs an empty table. Destinations
  // with an empty hop list are dropped (asserts in debug builds).
  void Update(std::shared_ptr<const NextHopTable> next_hops);

  // Number of destinations in the current snapshot.
  size_t ReachablePeers() const;

  // Number of equal-cost next hops for peer_id, 0 if unknown.
  size_t CountNextHops(const PeerId& peer_id) const;

  std::optional<std::vector<PeerId>> ViewRoute(const PeerId& peer_id) const;

  // PeerId target: least recently routed next hop, or PeerUnreachable.
  // CryptoHash target: consume the route-back entry, or RouteBackNotFound.
  FindRouteResult FindRoute(const PeerIdOrHash& target);

  void AddRouteBack(const CryptoHash& hash, const PeerId& previous_hop);

  // True iff a live route-back entry maps hash to peer_id. Does not consume it.
  bool CompareRouteBack(const CryptoHash& hash, const PeerId& peer_id) const;

  RoutingTableInfo Info() const;

  size_t RouteBackSize() const;

private:
  // Must be called with mutex_ held.
  FindRouteResult FindRouteFromPeerId(const PeerId& peer_id);

  const util::Clock& clock_;

  mutable std::mutex mutex_;
  std::shared_ptr<const NextHopTable> next_hops_;
  RouteBackCache route_back_;
  // Number of FindRoute calls by peer id so far
  uint64_t find_route_calls_{0};
  // Value of find_route_calls_ when each neighbor was last selected
  util::LruCache<PeerId, uint64_t, FixedHashHasher> last_routed_;
};

}  // namespace network
}  // namespace shardnet
