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

#include <string>

#include <glog/logging.h>

#include <stout/error.hpp>

#include "scheduler/constants.hpp"
#include "scheduler/reservation_policy.hpp"

using std::string;

namespace nodeledger {
namespace internal {
namespace scheduler {

Try<ReservationPolicy*> ReservationPolicy::create(const string& name)
{
  ReservationPolicy* policy = nullptr;

  if (name == CAPACITY_RESERVATION_POLICY) {
    policy = new CapacityReservationPolicy();
  } else if (name == FAIR_RESERVATION_POLICY) {
    policy = new FairReservationPolicy();
  } else if (name == NO_RESERVATION_POLICY) {
    policy = new NoReservationPolicy();
  } else {
    return Error("Unknown reservation policy '" + name + "'");
  }

  return policy;
}


// A container can only be reserved on the node it was placed on.
static bool isPlacedOn(const NodeIdentity& node, const Container& container)
{
  if (container.nodeId() != node.id()) {
    LOG(ERROR) << "Trying to reserve container " << container.id()
               << " on node " << node.address()
               << " but the container was placed on node "
               << container.nodeId();
    return false;
  }

  return true;
}


// Logs the transition of the slot before it gets overwritten.
static void logReserve(
    const NodeIdentity& node,
    const ApplicationAttemptID& attempt,
    const Priority& priority,
    const Container& container,
    const ReservationSlot& slot)
{
  if (slot.isReserved()) {
    const Container& reserved = slot.container().get();

    if (reserved.applicationAttemptId() != attempt) {
      LOG(WARNING) << "Replacing reservation of container " << reserved.id()
                   << " for application attempt "
                   << reserved.applicationAttemptId() << " on node "
                   << node.address() << " with container " << container.id()
                   << " for application attempt " << attempt;
    }

    LOG(INFO) << "Updated reserved container " << container.id()
              << " on node " << node.address() << " for application attempt "
              << attempt << " at priority " << priority;
  } else {
    LOG(INFO) << "Reserved container " << container.id()
              << " on node " << node.address() << " for application attempt "
              << attempt << " at priority " << priority;
  }
}


string CapacityReservationPolicy::name() const
{
  return CAPACITY_RESERVATION_POLICY;
}


void CapacityReservationPolicy::reserve(
    const NodeIdentity& node,
    const ApplicationAttemptID& attempt,
    const Priority& priority,
    const Container& container,
    ReservationSlot* slot)
{
  if (!isPlacedOn(node, container)) {
    return;
  }

  logReserve(node, attempt, priority, container, *slot);

  slot->reserve(container);
}


void CapacityReservationPolicy::unreserve(
    const NodeIdentity& node,
    const ApplicationAttemptID& attempt,
    ReservationSlot* slot)
{
  if (slot->isReserved()) {
    LOG(INFO) << "Unreserved container " << slot->container()->id()
              << " on node " << node.address() << " for application attempt "
              << attempt;
  }

  slot->clear();
}


string FairReservationPolicy::name() const
{
  return FAIR_RESERVATION_POLICY;
}


void FairReservationPolicy::reserve(
    const NodeIdentity& node,
    const ApplicationAttemptID& attempt,
    const Priority& priority,
    const Container& container,
    ReservationSlot* slot)
{
  if (!isPlacedOn(node, container)) {
    return;
  }

  logReserve(node, attempt, priority, container, *slot);

  slot->reserve(container, attempt);
}


void FairReservationPolicy::unreserve(
    const NodeIdentity& node,
    const ApplicationAttemptID& attempt,
    ReservationSlot* slot)
{
  if (slot->attempt().isSome() && slot->attempt().get() != attempt) {
    LOG(WARNING) << "Application attempt " << attempt
                 << " is unreserving node " << node.address()
                 << " which is reserved for application attempt "
                 << slot->attempt().get();
  }

  if (slot->isReserved()) {
    LOG(INFO) << "Unreserved container " << slot->container()->id()
              << " on node " << node.address() << " for application attempt "
              << attempt;
  }

  slot->clear();
}


string NoReservationPolicy::name() const
{
  return NO_RESERVATION_POLICY;
}

} // namespace scheduler {
} // namespace internal {
} // namespace nodeledger {
