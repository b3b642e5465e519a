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

#ifndef __SCHEDULER_NODE_IDENTITY_HPP__
#define __SCHEDULER_NODE_IDENTITY_HPP__

#include <string>

#include <nodeledger/nodeledger.hpp>

namespace nodeledger {
namespace internal {
namespace scheduler {

// The immutable part of a node, derived from the descriptor reported
// by the node's agent.
class NodeIdentity
{
public:
  NodeIdentity(const NodeInfo& _info, bool usePortForNodeName);

  const NodeID& id() const { return info_.id(); }

  // The name of the node for scheduling matching decisions. Typically
  // the hostname reported by the node, or 'hostname:port' if the
  // scheduler was asked to tell apart agents sharing a host.
  const std::string& name() const { return name_; }

  const std::string& hostname() const { return info_.hostname(); }
  const std::string& rack() const { return info_.rack(); }
  const std::string& httpAddress() const { return info_.http_address(); }

  // The address of the node's agent, i.e., 'host:port' of its id.
  const std::string& address() const { return address_; }

  const NodeInfo& info() const { return info_; }

private:
  const NodeInfo info_;
  const std::string name_;
  const std::string address_;
};

} // namespace scheduler {
} // namespace internal {
} // namespace nodeledger {

#endif // __SCHEDULER_NODE_IDENTITY_HPP__
