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

#ifndef __SCHEDULER_RESOURCE_LEDGER_HPP__
#define __SCHEDULER_RESOURCE_LEDGER_HPP__

#include <string>

#include <nodeledger/resources.hpp>

#include <stout/option.hpp>

namespace nodeledger {
namespace internal {
namespace scheduler {

// Tracks the total, available and used resources of one node.
//
// Invariant: total == available + used, except after
// `applyTotalCapacityDelta()` which only moves `available`.
//
// NOTE: Not thread-safe, the owning `Node` serializes access.
class ResourceLedger
{
public:
  // The node name is only used for logging.
  ResourceLedger(const std::string& node, const Resources& total);

  // Moves the resources from available to used. Absent or invalid
  // resources are logged and otherwise ignored.
  void allocate(const Option<Resources>& resources);

  // Moves the resources from used back to available. Absent or invalid
  // resources are logged and otherwise ignored.
  void release(const Option<Resources>& resources);

  // Adds the delta to the available resources only. The total is
  // expected to have been changed at its source of truth already;
  // use `updateTotal()` to resize the node consistently.
  void applyTotalCapacityDelta(const Resources& delta);

  // Sets the total and recomputes available as total - used.
  void updateTotal(const Resources& total);

  // Replaces the whole ledger, e.g., with the state recovered from
  // the journal.
  void reset(
      const Resources& total,
      const Resources& available,
      const Resources& used);

  const Resources& total() const { return total_; }
  const Resources& available() const { return available_; }
  const Resources& used() const { return used_; }

private:
  // Returns false (after logging why) if the resources cannot be
  // accounted for.
  bool isValid(const Option<Resources>& resources, const char* action) const;

  const std::string node;

  Resources total_;
  Resources available_;
  Resources used_;
};

} // namespace scheduler {
} // namespace internal {
} // namespace nodeledger {

#endif // __SCHEDULER_RESOURCE_LEDGER_HPP__
