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

#include <vector>

#include <glog/logging.h>

#include <stout/error.hpp>
#include <stout/foreach.hpp>
#include <stout/stringify.hpp>

#include "journal/node_state_builder.hpp"

#include "scheduler/validation.hpp"

using std::vector;

using nodeledger::journal::NodeMutation;
using nodeledger::journal::NodeState;

namespace nodeledger {
namespace internal {
namespace journal {

NodeStateBuilder::NodeStateBuilder(const NodeInfo& info)
{
  state_.mutable_node_id()->CopyFrom(info.id());
  state_.mutable_total()->CopyFrom(info.total_capability());
  state_.mutable_available()->CopyFrom(info.total_capability());
}


Try<Nothing> NodeStateBuilder::apply(const NodeMutation& mutation)
{
  switch (mutation.type()) {
    case NodeMutation::UPDATE_NODE_INFO: {
      if (!mutation.has_update_node_info()) {
        return Error("Expecting 'update_node_info' to be present");
      }
      return updateNodeInfo(mutation.update_node_info());
    }

    case NodeMutation::ADD_LAUNCHED_CONTAINER: {
      if (!mutation.has_add_launched_container()) {
        return Error("Expecting 'add_launched_container' to be present");
      }
      return addLaunchedContainer(
          mutation.add_launched_container().container());
    }

    case NodeMutation::REMOVE_LAUNCHED_CONTAINER: {
      if (!mutation.has_remove_launched_container()) {
        return Error("Expecting 'remove_launched_container' to be present");
      }
      return removeLaunchedContainer(
          mutation.remove_launched_container().container_id());
    }

    case NodeMutation::UPDATE_RESERVED_CONTAINER: {
      if (!mutation.has_update_reserved_container()) {
        return Error("Expecting 'update_reserved_container' to be present");
      }
      updateReservedContainer(mutation.update_reserved_container());
      return Nothing();
    }

    case NodeMutation::UNKNOWN:
      break;
  }

  return Error(
      "Unknown mutation type " + NodeMutation::Type_Name(mutation.type()));
}


Try<Nothing> NodeStateBuilder::apply(const vector<NodeMutation>& mutations)
{
  size_t index = 0;

  foreach (const NodeMutation& mutation, mutations) {
    Try<Nothing> applied = apply(mutation);
    if (applied.isError()) {
      return Error(
          "Failed to apply mutation " + stringify(index) + " to node " +
          stringify(state_.node_id()) + ": " + applied.error());
    }

    ++index;
  }

  VLOG(1) << "Applied " << mutations.size() << " mutations to node "
          << state_.node_id();

  return Nothing();
}


Try<Nothing> NodeStateBuilder::updateNodeInfo(
    const NodeMutation::NodeInfoUpdate& update)
{
  if (update.num_containers() != state_.launched_containers_size()) {
    return Error(
        "Node reported " + stringify(update.num_containers()) +
        " containers but " + stringify(state_.launched_containers_size()) +
        " were launched");
  }

  state_.mutable_total()->CopyFrom(update.total());
  state_.mutable_available()->CopyFrom(update.available());
  state_.mutable_used()->CopyFrom(update.used());

  return Nothing();
}


Try<Nothing> NodeStateBuilder::addLaunchedContainer(
    const ContainerInfo& container)
{
  Option<Error> error =
    scheduler::validation::container::validate(container);

  if (error.isSome()) {
    return error.get();
  }

  foreach (const ContainerInfo& launched, state_.launched_containers()) {
    if (launched.container_id() == container.container_id()) {
      return Error(
          "Container " + stringify(container.container_id()) +
          " is already launched");
    }
  }

  state_.add_launched_containers()->CopyFrom(container);

  return Nothing();
}


Try<Nothing> NodeStateBuilder::removeLaunchedContainer(
    const ContainerID& containerId)
{
  for (int i = 0; i < state_.launched_containers_size(); ++i) {
    if (state_.launched_containers(i).container_id() == containerId) {
      state_.mutable_launched_containers()->DeleteSubrange(i, 1);
      return Nothing();
    }
  }

  return Error(
      "Container " + stringify(containerId) + " was never launched");
}


void NodeStateBuilder::updateReservedContainer(
    const NodeMutation::UpdateReservedContainer& update)
{
  if (update.has_container()) {
    state_.mutable_reserved_container()->CopyFrom(update.container());
  } else {
    state_.clear_reserved_container();
  }

  if (update.has_application_attempt_id()) {
    state_.mutable_reserved_attempt()->CopyFrom(
        update.application_attempt_id());
  } else {
    state_.clear_reserved_attempt();
  }
}

} // namespace journal {
} // namespace internal {
} // namespace nodeledger {
