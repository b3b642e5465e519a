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

#ifndef __TESTS_UTILS_HPP__
#define __TESTS_UTILS_HPP__

#include <stdint.h>

#include <string>

#include <nodeledger/container.hpp>
#include <nodeledger/nodeledger.hpp>
#include <nodeledger/resources.hpp>

#include <stout/check.hpp>
#include <stout/none.hpp>
#include <stout/option.hpp>

#include "common/protobuf_utils.hpp"

namespace nodeledger {
namespace internal {
namespace tests {

// All test applications belong to the same cluster.
constexpr int64_t CLUSTER_TIMESTAMP = 1400000000000;


inline Resources createResources(const std::string& text)
{
  return CHECK_NOTERROR(Resources::parse(text));
}


inline NodeInfo createNodeInfo(
    const std::string& host,
    int32_t port,
    const std::string& total)
{
  return protobuf::createNodeInfo(
      protobuf::createNodeId(host, port),
      host,
      createResources(total),
      std::string("/rack1"),
      host + ":8042");
}


inline ApplicationAttemptID createAttemptId(
    int32_t application,
    int32_t attempt = 1)
{
  return protobuf::createApplicationAttemptId(
      protobuf::createApplicationId(CLUSTER_TIMESTAMP, application),
      attempt);
}


// Creates a container of the given attempt placed on the node. A
// `None` demand creates a container without any resources attached.
inline Container createContainer(
    const NodeID& nodeId,
    const ApplicationAttemptID& attemptId,
    int64_t id,
    const Option<std::string>& demand)
{
  Option<Resources> resources;
  if (demand.isSome()) {
    resources = createResources(demand.get());
  }

  return Container(protobuf::createContainerInfo(
      protobuf::createContainerId(attemptId, id),
      nodeId,
      resources,
      protobuf::createPriority(1)));
}

} // namespace tests {
} // namespace internal {
} // namespace nodeledger {

#endif // __TESTS_UTILS_HPP__
