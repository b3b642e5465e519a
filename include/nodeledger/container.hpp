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

#ifndef __NODELEDGER_CONTAINER_HPP__
#define __NODELEDGER_CONTAINER_HPP__

#include <ostream>

#include <nodeledger/nodeledger.hpp>
#include <nodeledger/resources.hpp>

#include <stout/option.hpp>

namespace nodeledger {

// A container as seen by the scheduler. The scheduler owns containers;
// a node only keeps a copy of the handle while the container occupies
// (or has reserved) capacity on it.
class Container
{
public:
  explicit Container(const ContainerInfo& _info) : info_(_info) {}

  const ContainerID& id() const { return info_.container_id(); }

  const ApplicationAttemptID& applicationAttemptId() const
  {
    return info_.container_id().application_attempt_id();
  }

  const ApplicationID& applicationId() const
  {
    return applicationAttemptId().application_id();
  }

  const NodeID& nodeId() const { return info_.node_id(); }

  Option<Priority> priority() const
  {
    if (info_.has_priority()) {
      return info_.priority();
    }
    return None();
  }

  // The resources the container demands. None if the scheduler never
  // attached a demand to it.
  Option<Resources> resources() const
  {
    if (info_.has_demand()) {
      return Resources(info_.demand().resources());
    }
    return None();
  }

  const ContainerInfo& info() const { return info_; }

private:
  ContainerInfo info_;
};


inline bool operator==(const Container& left, const Container& right)
{
  return left.id() == right.id();
}


inline bool operator!=(const Container& left, const Container& right)
{
  return !(left == right);
}


inline std::ostream& operator<<(
    std::ostream& stream,
    const Container& container)
{
  return stream << container.id();
}

} // namespace nodeledger {

#endif // __NODELEDGER_CONTAINER_HPP__
