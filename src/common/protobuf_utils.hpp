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

#ifndef __PROTOBUF_UTILS_HPP__
#define __PROTOBUF_UTILS_HPP__

#include <stdint.h>

#include <string>

#include <nodeledger/container.hpp>
#include <nodeledger/nodeledger.hpp>
#include <nodeledger/resources.hpp>

#include <nodeledger/journal/journal.hpp>

#include <stout/none.hpp>
#include <stout/option.hpp>

namespace nodeledger {
namespace internal {
namespace protobuf {

NodeID createNodeId(const std::string& host, int32_t port);


ApplicationID createApplicationId(int64_t clusterTimestamp, int32_t id);


ApplicationAttemptID createApplicationAttemptId(
    const ApplicationID& applicationId,
    int32_t attemptId);


ContainerID createContainerId(
    const ApplicationAttemptID& applicationAttemptId,
    int64_t id);


Priority createPriority(int32_t priority);


// Helper for creating a container descriptor. A `None` demand
// produces a descriptor without the 'demand' field.
ContainerInfo createContainerInfo(
    const ContainerID& containerId,
    const NodeID& nodeId,
    const Option<Resources>& demand,
    const Option<Priority>& priority = None());


NodeInfo createNodeInfo(
    const NodeID& nodeId,
    const std::string& hostname,
    const Resources& totalCapability,
    const Option<std::string>& rack = None(),
    const Option<std::string>& httpAddress = None());


namespace journal {

nodeledger::journal::NodeMutation createUpdateNodeInfo(
    const Resources& total,
    const Resources& available,
    const Resources& used,
    int numContainers);


nodeledger::journal::NodeMutation createAddLaunchedContainer(
    const Container& container);


nodeledger::journal::NodeMutation createRemoveLaunchedContainer(
    const ContainerID& containerId);


// A `None` container records that the reservation was cleared.
nodeledger::journal::NodeMutation createUpdateReservedContainer(
    const Option<Container>& container,
    const Option<ApplicationAttemptID>& applicationAttemptId);

} // namespace journal {

} // namespace protobuf {
} // namespace internal {
} // namespace nodeledger {

#endif // __PROTOBUF_UTILS_HPP__
