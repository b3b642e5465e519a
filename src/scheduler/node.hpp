// Licensed to the Apache Software Foundation (ASF) under one
// or more contributor license agreements.  See the NOTICE file
// distributed with this work for additional information
// regarding copyright ownership.  The ASF licenses this file
// to you under the Apache License, Version 2.0 (the
// "License"); you may not use this file except in compliance
// with the License.  You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#ifndef __SCHEDULER_NODE_HPP__
#define __SCHEDULER_NODE_HPP__

#include <mutex>
#include <ostream>
#include <string>
#include <vector>

#include <nodeledger/container.hpp>
#include <nodeledger/nodeledger.hpp>
#include <nodeledger/resources.hpp>

#include <nodeledger/journal/journal.hpp>

#include <process/owned.hpp>

#include <stout/hashmap.hpp>
#include <stout/none.hpp>
#include <stout/nothing.hpp>
#include <stout/option.hpp>
#include <stout/try.hpp>

#include "scheduler/container_registry.hpp"
#include "scheduler/flags.hpp"
#include "scheduler/node_identity.hpp"
#include "scheduler/reservation.hpp"
#include "scheduler/reservation_policy.hpp"
#include "scheduler/resource_ledger.hpp"

namespace nodeledger {
namespace internal {
namespace scheduler {

// Represents a cluster node from the viewpoint of the scheduler: what
// the node can hold, what the containers launched on it use, and the
// container (if any) the scheduler reserved the node for.
//
// All mutable state is guarded by a single lock per node. Every
// mutator holds the lock for its whole duration, including the call
// into the journal of the transaction it was given, so a replica
// replaying the journal observes the mutations in the order they were
// applied here.
//
// Mutators never fail: malformed input (absent or invalid resources,
// unknown containers) is logged and otherwise ignored so that one bad
// request does not stall scheduling on other nodes.
class Node
{
public:
  // Creates a node with the reservation policy and naming selected by
  // the flags. If `Try` does not report an error, the wrapped `Node*`
  // is not null.
  static Try<Node*> create(const NodeInfo& info, const Flags& flags);

  Node(
      const NodeInfo& info,
      bool usePortForNodeName,
      const process::Owned<ReservationPolicy>& policy);

  Node(const Node&) = delete;
  Node& operator=(const Node&) = delete;

  const NodeID& id() const { return identity.id(); }
  const std::string& name() const { return identity.name(); }
  const std::string& rack() const { return identity.rack(); }
  const std::string& httpAddress() const { return identity.httpAddress(); }
  const std::string& address() const { return identity.address(); }
  const NodeInfo& info() const { return identity.info(); }

  const ReservationPolicy& reservationPolicy() const { return *policy; }

  // The scheduler allocated the container on this node to the given
  // application. Allocating a container id that is already present is
  // logged and ignored.
  void allocateContainer(
      const ApplicationID& applicationId,
      const Container& container,
      const Option<nodeledger::journal::Transaction>& transaction = None());

  // Releases a container previously allocated on this node. Releasing
  // an unknown container is logged and ignored, which tolerates
  // duplicate or reordered release requests.
  void releaseContainer(
      const Container& container,
      const Option<nodeledger::journal::Transaction>& transaction = None());

  // Adds the delta to the available resources only; neither the total
  // nor the used resources change. See `ResourceLedger`.
  void applyTotalCapacityDelta(const Resources& delta);

  // Resizes the node: sets the total and recomputes the available
  // resources from what is currently used.
  void updateTotalResource(
      const Resources& total,
      const Option<nodeledger::journal::Transaction>& transaction = None());

  // Reserves the node for the container on behalf of the attempt, as
  // decided by the node's reservation policy. An existing reservation
  // is replaced.
  void reserveResource(
      const ApplicationAttemptID& attempt,
      const Priority& priority,
      const Container& container,
      const Option<nodeledger::journal::Transaction>& transaction = None());

  // Clears the reservation, as decided by the node's reservation
  // policy.
  void unreserveResource(
      const ApplicationAttemptID& attempt,
      const Option<nodeledger::journal::Transaction>& transaction = None());

  // Replaces all mutable state with the state rebuilt from the
  // journal by a failover replica. Fails without touching the node if
  // the state belongs to another node or is malformed.
  Try<Nothing> recover(const nodeledger::journal::NodeState& state);

  Resources available() const;
  Resources used() const;
  Resources total() const;

  int numContainers() const;

  // Returns a copy of the containers running on this node.
  std::vector<Container> runningContainers() const;

  // Returns the live map of containers launched on this node.
  //
  // NOTE: The map is mutated by every allocation and release without
  // any synchronization with the caller; only callers that serialize
  // with all mutators of this node may use it, and none may keep it.
  // Prefer `runningContainers()`.
  hashmap<ContainerID, Container>& launchedContainers();

  Option<Container> reservedContainer() const;

  // The attempt the node is reserved for, if the reservation policy
  // keeps track of it.
  Option<ApplicationAttemptID> reservedAttempt() const;

  // E.g., "host: host1:8041 #containers=2 available=5120 used=3072".
  std::string toString() const;

private:
  // Hands the mutation to the transaction's journal, if any.
  // Must be called with `mutex` held.
  void record(
      const Option<nodeledger::journal::Transaction>& transaction,
      const nodeledger::journal::NodeMutation& mutation) const;

  // Records a snapshot of the ledger. Must be called with `mutex` held.
  void recordNodeInfo(
      const Option<nodeledger::journal::Transaction>& transaction) const;

  const NodeIdentity identity;
  const process::Owned<ReservationPolicy> policy;

  mutable std::mutex mutex;

  // The following are guarded by `mutex`.
  ResourceLedger ledger;
  ContainerRegistry containers;
  ReservationSlot reservation;
};


std::ostream& operator<<(std::ostream& stream, const Node& node);

} // namespace scheduler {
} // namespace internal {
} // namespace nodeledger {

#endif // __SCHEDULER_NODE_HPP__
