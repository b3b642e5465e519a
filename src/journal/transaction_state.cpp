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

#include <utility>
#include <vector>

#include <glog/logging.h>

#include <stout/synchronized.hpp>

#include "journal/transaction_state.hpp"

using std::vector;

using nodeledger::journal::NodeMutation;

namespace nodeledger {
namespace internal {
namespace journal {

void TransactionState::record(
    const NodeID& nodeId,
    const NodeMutation& mutation)
{
  synchronized (mutex) {
    mutations_[nodeId].push_back(mutation);
    ++size_;

    VLOG(2) << "Recorded " << NodeMutation::Type_Name(mutation.type())
            << " for node " << nodeId;
  }
}


vector<NodeMutation> TransactionState::mutations(const NodeID& nodeId) const
{
  synchronized (mutex) {
    return mutations_.get(nodeId).getOrElse(vector<NodeMutation>());
  }
}


size_t TransactionState::size() const
{
  synchronized (mutex) {
    return size_;
  }
}


TransactionState::Mutations TransactionState::commit()
{
  synchronized (mutex) {
    Mutations committed;
    std::swap(committed, mutations_);

    VLOG(1) << "Committing " << size_ << " mutations of "
            << committed.size() << " nodes";

    size_ = 0;
    return committed;
  }
}

} // namespace journal {
} // namespace internal {
} // namespace nodeledger {
