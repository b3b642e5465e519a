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

#ifndef __NODELEDGER_JOURNAL_JOURNAL_HPP__
#define __NODELEDGER_JOURNAL_JOURNAL_HPP__

#include <glog/logging.h>

#include <nodeledger/nodeledger.hpp>

#include <nodeledger/journal/journal.pb.h> // ONLY USEFUL AFTER RUNNING PROTOC.

namespace nodeledger {
namespace journal {

// The recovery journal port. Implementations mirror node mutations
// into a durable, replicated log so that a failover scheduler can
// rebuild its view of every node (see `NodeStateBuilder`).
//
// NOTE: `record()` is invoked while the node's lock is held, so that
// no observer can see a mutation before it has been handed to the
// journal. Implementations must therefore only enqueue the mutation
// (or otherwise complete in bounded time) and must never call back
// into the node.
class Journal
{
public:
  virtual ~Journal() {}

  virtual void record(const NodeID& nodeId, const NodeMutation& mutation) = 0;
};


// A handle that groups node mutations into one external commit. The
// scheduler passes a transaction into every node mutator whose effect
// must survive a failover; mutators invoked without one are not
// journaled.
//
// A transaction does not own its journal, which must outlive it.
class Transaction
{
public:
  explicit Transaction(Journal* _journal)
    : journal(CHECK_NOTNULL(_journal)) {}

  void record(const NodeID& nodeId, const NodeMutation& mutation) const
  {
    journal->record(nodeId, mutation);
  }

private:
  Journal* journal;
};

} // namespace journal {
} // namespace nodeledger {

#endif // __NODELEDGER_JOURNAL_JOURNAL_HPP__
