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

#ifndef __JOURNAL_TRANSACTION_STATE_HPP__
#define __JOURNAL_TRANSACTION_STATE_HPP__

#include <mutex>
#include <vector>

#include <nodeledger/nodeledger.hpp>

#include <nodeledger/journal/journal.hpp>

#include <stout/hashmap.hpp>

namespace nodeledger {
namespace internal {
namespace journal {

// An in-memory journal that collects the node mutations of one
// scheduler transaction, grouped by node, until the transaction is
// committed to durable storage by its owner.
//
// Nodes record into the same transaction concurrently, hence all
// operations are thread-safe. Recording only appends to a vector and
// never blocks on anything but the transaction's own lock.
class TransactionState : public nodeledger::journal::Journal
{
public:
  typedef hashmap<NodeID, std::vector<nodeledger::journal::NodeMutation>>
    Mutations;

  void record(
      const NodeID& nodeId,
      const nodeledger::journal::NodeMutation& mutation) override;

  // Returns the mutations recorded so far for the node, in the order
  // they were recorded.
  std::vector<nodeledger::journal::NodeMutation> mutations(
      const NodeID& nodeId) const;

  // Total number of mutations recorded across all nodes.
  size_t size() const;

  // Hands out everything recorded so far and starts over. Mutations
  // of one node keep their relative order.
  Mutations commit();

private:
  mutable std::mutex mutex;
  Mutations mutations_;
  size_t size_ = 0;
};

} // namespace journal {
} // namespace internal {
} // namespace nodeledger {

#endif // __JOURNAL_TRANSACTION_STATE_HPP__
