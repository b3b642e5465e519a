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

#include <limits>
#include <sstream>
#include <string>
#include <vector>

#include <glog/logging.h>

#include <stout/error.hpp>
#include <stout/foreach.hpp>
#include <stout/stringify.hpp>
#include <stout/synchronized.hpp>

#include "common/protobuf_utils.hpp"

#include "scheduler/node.hpp"
#include "scheduler/validation.hpp"

using std::ostream;
using std::ostringstream;
using std::string;
using std::vector;

using process::Owned;

using nodeledger::journal::NodeMutation;
using nodeledger::journal::NodeState;
using nodeledger::journal::Transaction;

namespace nodeledger {
namespace internal {
namespace scheduler {

Try<Node*> Node::create(const NodeInfo& info, const Flags& flags)
{
  Option<Error> error = validation::node::validate(info);
  if (error.isSome()) {
    return Error("Invalid node descriptor: " + error->message);
  }

  Try<ReservationPolicy*> policy =
    ReservationPolicy::create(flags.reservation_policy);

  if (policy.isError()) {
    return Error(
        "Failed to create reservation policy: " + policy.error());
  }

  return new Node(
      info,
      flags.include_port_in_node_name,
      Owned<ReservationPolicy>(policy.get()));
}


Node::Node(
    const NodeInfo& info,
    bool usePortForNodeName,
    const Owned<ReservationPolicy>& _policy)
  : identity(info, usePortForNodeName),
    policy(_policy),
    ledger(identity.address(), Resources(info.total_capability()))
{
  CHECK_NOTNULL(policy.get());
}


void Node::allocateContainer(
    const ApplicationID& applicationId,
    const Container& container,
    const Option<Transaction>& transaction)
{
  synchronized (mutex) {
    if (containers.contains(container.id())) {
      LOG(WARNING) << "Ignoring allocation of container " << container.id()
                   << " of application " << applicationId
                   << " on host " << address()
                   << " since the container is already allocated";
      return;
    }

    ledger.allocate(container.resources());
    containers.add(container);

    record(transaction, protobuf::journal::createAddLaunchedContainer(
        container));
    recordNodeInfo(transaction);

    LOG(INFO) << "Assigned container " << container.id()
              << " of application " << applicationId << " of capacity "
              << (container.resources().isSome()
                    ? stringify(container.resources().get())
                    : "<null>")
              << " on host " << address() << ", which currently has "
              << containers.size() << " containers, " << ledger.used()
              << " used and " << ledger.available() << " available";
  }
}


void Node::releaseContainer(
    const Container& container,
    const Option<Transaction>& transaction)
{
  synchronized (mutex) {
    Option<Container> launched = containers.get(container.id());
    if (launched.isNone()) {
      LOG(ERROR) << "Invalid container released " << container.id()
                 << " on host " << address();
      return;
    }

    containers.remove(container.id());

    // Release what was accounted for on allocation, in case the
    // caller's handle carries a different demand.
    ledger.release(launched->resources());

    record(transaction, protobuf::journal::createRemoveLaunchedContainer(
        container.id()));
    recordNodeInfo(transaction);

    LOG(INFO) << "Released container " << container.id() << " of capacity "
              << (launched->resources().isSome()
                    ? stringify(launched->resources().get())
                    : "<null>")
              << " on host " << address() << ", which currently has "
              << containers.size() << " containers, " << ledger.used()
              << " used and " << ledger.available() << " available";
  }
}


void Node::applyTotalCapacityDelta(const Resources& delta)
{
  synchronized (mutex) {
    ledger.applyTotalCapacityDelta(delta);

    VLOG(1) << "Applied delta " << delta << " to the available resources"
            << " of host " << address() << ", which now has "
            << ledger.available() << " available";
  }
}


void Node::updateTotalResource(
    const Resources& total,
    const Option<Transaction>& transaction)
{
  synchronized (mutex) {
    const Resources previous = ledger.total();

    ledger.updateTotal(total);

    recordNodeInfo(transaction);

    LOG(INFO) << "Updated total resources of host " << address()
              << " from " << previous << " to " << total
              << ", which now has " << ledger.used() << " used and "
              << ledger.available() << " available";
  }
}


void Node::reserveResource(
    const ApplicationAttemptID& attempt,
    const Priority& priority,
    const Container& container,
    const Option<Transaction>& transaction)
{
  synchronized (mutex) {
    const uint64_t generation = reservation.generation();

    policy->reserve(identity, attempt, priority, container, &reservation);

    if (reservation.generation() != generation) {
      record(transaction, protobuf::journal::createUpdateReservedContainer(
          reservation.container(), reservation.attempt()));
    }
  }
}


void Node::unreserveResource(
    const ApplicationAttemptID& attempt,
    const Option<Transaction>& transaction)
{
  synchronized (mutex) {
    const uint64_t generation = reservation.generation();

    policy->unreserve(identity, attempt, &reservation);

    if (reservation.generation() != generation) {
      record(transaction, protobuf::journal::createUpdateReservedContainer(
          reservation.container(), reservation.attempt()));
    }
  }
}


Try<Nothing> Node::recover(const NodeState& state)
{
  if (state.node_id() != id()) {
    return Error(
        "Cannot recover node " + stringify(id()) + " from the state of"
        " node " + stringify(state.node_id()));
  }

  ContainerRegistry recovered;

  foreach (const ContainerInfo& info, state.launched_containers()) {
    Option<Error> error = validation::container::validate(info);
    if (error.isSome()) {
      return Error("Cannot recover launched container: " + error->message);
    }

    if (!recovered.add(Container(info))) {
      return Error(
          "Cannot recover container " + stringify(info.container_id()) +
          " twice");
    }
  }

  Option<Container> reserved;
  if (state.has_reserved_container()) {
    Option<Error> error =
      validation::container::validate(state.reserved_container());

    if (error.isSome()) {
      return Error("Cannot recover reserved container: " + error->message);
    }

    reserved = Container(state.reserved_container());
  }

  Option<ApplicationAttemptID> reservedAttempt;
  if (state.has_reserved_attempt()) {
    reservedAttempt = state.reserved_attempt();
  }

  synchronized (mutex) {
    ledger.reset(state.total(), state.available(), state.used());
    containers = recovered;

    if (reserved.isSome()) {
      reservation.reserve(reserved.get(), reservedAttempt);
    } else {
      reservation.clear();
    }

    LOG(INFO) << "Recovered host " << address() << " with "
              << containers.size() << " containers, " << ledger.used()
              << " used and " << ledger.available() << " available";

    return Nothing();
  }
}


Resources Node::available() const
{
  synchronized (mutex) {
    return ledger.available();
  }
}


Resources Node::used() const
{
  synchronized (mutex) {
    return ledger.used();
  }
}


Resources Node::total() const
{
  synchronized (mutex) {
    return ledger.total();
  }
}


int Node::numContainers() const
{
  synchronized (mutex) {
    return static_cast<int>(containers.size());
  }
}


vector<Container> Node::runningContainers() const
{
  synchronized (mutex) {
    return containers.snapshot();
  }
}


hashmap<ContainerID, Container>& Node::launchedContainers()
{
  synchronized (mutex) {
    return containers.view();
  }
}


Option<Container> Node::reservedContainer() const
{
  synchronized (mutex) {
    return reservation.container();
  }
}


Option<ApplicationAttemptID> Node::reservedAttempt() const
{
  synchronized (mutex) {
    return reservation.attempt();
  }
}


string Node::toString() const
{
  synchronized (mutex) {
    ostringstream out;

    // Print memory in full, e.g., 1048576 rather than 1.04858e+06.
    out.precision(std::numeric_limits<double>::digits10);

    out << "host: " << address()
        << " #containers=" << containers.size()
        << " available=" << ledger.available().memory()
        << " used=" << ledger.used().memory();

    return out.str();
  }
}


void Node::record(
    const Option<Transaction>& transaction,
    const NodeMutation& mutation) const
{
  if (transaction.isSome()) {
    transaction->record(id(), mutation);
  }
}


void Node::recordNodeInfo(const Option<Transaction>& transaction) const
{
  if (transaction.isSome()) {
    transaction->record(id(), protobuf::journal::createUpdateNodeInfo(
        ledger.total(),
        ledger.available(),
        ledger.used(),
        static_cast<int>(containers.size())));
  }
}


ostream& operator<<(ostream& stream, const Node& node)
{
  return stream << node.toString();
}

} // namespace scheduler {
} // namespace internal {
} // namespace nodeledger {
