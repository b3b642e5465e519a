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

#include <string>

#include "common/protobuf_utils.hpp"

using std::string;

using nodeledger::journal::NodeMutation;

namespace nodeledger {
namespace internal {
namespace protobuf {

NodeID createNodeId(const string& host, int32_t port)
{
  NodeID nodeId;
  nodeId.set_host(host);
  nodeId.set_port(port);
  return nodeId;
}


ApplicationID createApplicationId(int64_t clusterTimestamp, int32_t id)
{
  ApplicationID applicationId;
  applicationId.set_cluster_timestamp(clusterTimestamp);
  applicationId.set_id(id);
  return applicationId;
}


ApplicationAttemptID createApplicationAttemptId(
    const ApplicationID& applicationId,
    int32_t attemptId)
{
  ApplicationAttemptID applicationAttemptId;
  applicationAttemptId.mutable_application_id()->CopyFrom(applicationId);
  applicationAttemptId.set_attempt_id(attemptId);
  return applicationAttemptId;
}


ContainerID createContainerId(
    const ApplicationAttemptID& applicationAttemptId,
    int64_t id)
{
  ContainerID containerId;
  containerId.mutable_application_attempt_id()->CopyFrom(
      applicationAttemptId);
  containerId.set_id(id);
  return containerId;
}


Priority createPriority(int32_t priority)
{
  Priority result;
  result.set_priority(priority);
  return result;
}


ContainerInfo createContainerInfo(
    const ContainerID& containerId,
    const NodeID& nodeId,
    const Option<Resources>& demand,
    const Option<Priority>& priority)
{
  ContainerInfo info;
  info.mutable_container_id()->CopyFrom(containerId);
  info.mutable_node_id()->CopyFrom(nodeId);

  if (demand.isSome()) {
    info.mutable_demand()->mutable_resources()->CopyFrom(demand.get());
  }

  if (priority.isSome()) {
    info.mutable_priority()->CopyFrom(priority.get());
  }

  return info;
}


NodeInfo createNodeInfo(
    const NodeID& nodeId,
    const string& hostname,
    const Resources& totalCapability,
    const Option<string>& rack,
    const Option<string>& httpAddress)
{
  NodeInfo info;
  info.mutable_id()->CopyFrom(nodeId);
  info.set_hostname(hostname);
  info.mutable_total_capability()->CopyFrom(totalCapability);

  if (rack.isSome()) {
    info.set_rack(rack.get());
  }

  if (httpAddress.isSome()) {
    info.set_http_address(httpAddress.get());
  }

  return info;
}


namespace journal {

NodeMutation createUpdateNodeInfo(
    const Resources& total,
    const Resources& available,
    const Resources& used,
    int numContainers)
{
  NodeMutation mutation;
  mutation.set_type(NodeMutation::UPDATE_NODE_INFO);

  NodeMutation::NodeInfoUpdate* update = mutation.mutable_update_node_info();
  update->mutable_total()->CopyFrom(total);
  update->mutable_available()->CopyFrom(available);
  update->mutable_used()->CopyFrom(used);
  update->set_num_containers(numContainers);

  return mutation;
}


NodeMutation createAddLaunchedContainer(const Container& container)
{
  NodeMutation mutation;
  mutation.set_type(NodeMutation::ADD_LAUNCHED_CONTAINER);
  mutation.mutable_add_launched_container()->mutable_container()->CopyFrom(
      container.info());

  return mutation;
}


NodeMutation createRemoveLaunchedContainer(const ContainerID& containerId)
{
  NodeMutation mutation;
  mutation.set_type(NodeMutation::REMOVE_LAUNCHED_CONTAINER);
  mutation.mutable_remove_launched_container()->mutable_container_id()
    ->CopyFrom(containerId);

  return mutation;
}


NodeMutation createUpdateReservedContainer(
    const Option<Container>& container,
    const Option<ApplicationAttemptID>& applicationAttemptId)
{
  NodeMutation mutation;
  mutation.set_type(NodeMutation::UPDATE_RESERVED_CONTAINER);

  NodeMutation::UpdateReservedContainer* update =
    mutation.mutable_update_reserved_container();

  if (container.isSome()) {
    update->mutable_container()->CopyFrom(container->info());
  }

  if (applicationAttemptId.isSome()) {
    update->mutable_application_attempt_id()->CopyFrom(
        applicationAttemptId.get());
  }

  return mutation;
}

} // namespace journal {

} // namespace protobuf {
} // namespace internal {
} // namespace nodeledger {
