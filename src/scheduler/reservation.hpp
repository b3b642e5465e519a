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

#ifndef __SCHEDULER_RESERVATION_HPP__
#define __SCHEDULER_RESERVATION_HPP__

#include <stdint.h>

#include <nodeledger/container.hpp>
#include <nodeledger/nodeledger.hpp>

#include <stout/none.hpp>
#include <stout/option.hpp>

namespace nodeledger {
namespace internal {
namespace scheduler {

// Holds at most one outstanding reservation of a node: a container
// that the scheduler intends to launch on the node once enough
// capacity frees up.
//
// A new reservation replaces the previous one without releasing it;
// reconciling the replaced reservation is up to the caller.
//
// NOTE: Not thread-safe, the owning `Node` serializes access.
class ReservationSlot
{
public:
  ReservationSlot() : generation_(0) {}

  bool isReserved() const { return container_.isSome(); }

  const Option<Container>& container() const { return container_; }

  // The attempt that made the reservation, if the reservation policy
  // keeps track of it.
  const Option<ApplicationAttemptID>& attempt() const { return attempt_; }

  void reserve(
      const Container& container,
      const Option<ApplicationAttemptID>& attempt = None())
  {
    container_ = container;
    attempt_ = attempt;
    ++generation_;
  }

  void clear()
  {
    container_ = None();
    attempt_ = None();
    ++generation_;
  }

  // Bumped on every change; lets the node tell whether a reservation
  // policy touched the slot and hence whether to journal it.
  uint64_t generation() const { return generation_; }

private:
  Option<Container> container_;
  Option<ApplicationAttemptID> attempt_;
  uint64_t generation_;
};

} // namespace scheduler {
} // namespace internal {
} // namespace nodeledger {

#endif // __SCHEDULER_RESERVATION_HPP__
