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

#ifndef __SCHEDULER_RESERVATION_POLICY_HPP__
#define __SCHEDULER_RESERVATION_POLICY_HPP__

#include <string>

#include <nodeledger/container.hpp>
#include <nodeledger/nodeledger.hpp>

#include <stout/try.hpp>

#include "scheduler/node_identity.hpp"
#include "scheduler/reservation.hpp"

namespace nodeledger {
namespace internal {
namespace scheduler {

// Decides how a node holds capacity for a request that does not fit
// on it yet. Each scheduling strategy brings its own policy and the
// node delegates `reserveResource()` and `unreserveResource()` to it.
//
// Both calls are made with the node's lock held. A policy records its
// decision in the given slot; the node journals the slot afterwards if
// it changed. A policy must not call back into the node.
//
// NOTE: Policies do not check that an unreserving attempt is the one
// that made the reservation; that is left to the caller.
class ReservationPolicy
{
public:
  // Creates one of the built-in policies ("capacity", "fair" or
  // "none"). If `Try` does not report an error, the wrapped
  // `ReservationPolicy*` is not null.
  static Try<ReservationPolicy*> create(const std::string& name);

  virtual ~ReservationPolicy() {}

  virtual std::string name() const = 0;

  virtual void reserve(
      const NodeIdentity& node,
      const ApplicationAttemptID& attempt,
      const Priority& priority,
      const Container& container,
      ReservationSlot* slot) = 0;

  virtual void unreserve(
      const NodeIdentity& node,
      const ApplicationAttemptID& attempt,
      ReservationSlot* slot) = 0;
};


// Holds the node for the reserved container so that a large request
// is not starved by smaller ones that keep fragmenting the node.
class CapacityReservationPolicy : public ReservationPolicy
{
public:
  std::string name() const override;

  void reserve(
      const NodeIdentity& node,
      const ApplicationAttemptID& attempt,
      const Priority& priority,
      const Container& container,
      ReservationSlot* slot) override;

  void unreserve(
      const NodeIdentity& node,
      const ApplicationAttemptID& attempt,
      ReservationSlot* slot) override;
};


// Like the capacity policy, but also remembers which application
// attempt holds the reservation so that fair share accounting can
// charge it.
class FairReservationPolicy : public ReservationPolicy
{
public:
  std::string name() const override;

  void reserve(
      const NodeIdentity& node,
      const ApplicationAttemptID& attempt,
      const Priority& priority,
      const Container& container,
      ReservationSlot* slot) override;

  void unreserve(
      const NodeIdentity& node,
      const ApplicationAttemptID& attempt,
      ReservationSlot* slot) override;
};


// For strategies without a notion of reservations.
class NoReservationPolicy : public ReservationPolicy
{
public:
  std::string name() const override;

  void reserve(
      const NodeIdentity&,
      const ApplicationAttemptID&,
      const Priority&,
      const Container&,
      ReservationSlot*) override {}

  void unreserve(
      const NodeIdentity&,
      const ApplicationAttemptID&,
      ReservationSlot*) override {}
};

} // namespace scheduler {
} // namespace internal {
} // namespace nodeledger {

#endif // __SCHEDULER_RESERVATION_POLICY_HPP__
