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

#ifndef __JOURNAL_NODE_STATE_BUILDER_HPP__
#define __JOURNAL_NODE_STATE_BUILDER_HPP__

#include <vector>

#include <nodeledger/nodeledger.hpp>

#include <nodeledger/journal/journal.hpp>

#include <stout/nothing.hpp>
#include <stout/try.hpp>

namespace nodeledger {
namespace internal {
namespace journal {

// Rebuilds the recoverable state of one node by folding the mutations
// journaled for it, oldest first, over the state the node had when the
// scheduler started tracking it. A failover replica then hands the
// result to `Node::recover()`.
class NodeStateBuilder
{
public:
  explicit NodeStateBuilder(const NodeInfo& info);

  // Applies one mutation. Returns an error, leaving the state as it
  // was, if the mutation is malformed or inconsistent with the
  // mutations applied before it (e.g., removing a container that was
  // never added).
  Try<Nothing> apply(const nodeledger::journal::NodeMutation& mutation);

  // Applies the mutations in order, stopping at the first error.
  Try<Nothing> apply(
      const std::vector<nodeledger::journal::NodeMutation>& mutations);

  const nodeledger::journal::NodeState& state() const { return state_; }

private:
  Try<Nothing> updateNodeInfo(
      const nodeledger::journal::NodeMutation::NodeInfoUpdate& update);

  Try<Nothing> addLaunchedContainer(const ContainerInfo& container);

  Try<Nothing> removeLaunchedContainer(const ContainerID& containerId);

  void updateReservedContainer(
      const nodeledger::journal::NodeMutation::UpdateReservedContainer&
        update);

  nodeledger::journal::NodeState state_;
};

} // namespace journal {
} // namespace internal {
} // namespace nodeledger {

#endif // __JOURNAL_NODE_STATE_BUILDER_HPP__
