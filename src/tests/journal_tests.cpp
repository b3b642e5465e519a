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

#include <limits>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include <nodeledger/container.hpp>
#include <nodeledger/nodeledger.hpp>
#include <nodeledger/resources.hpp>

#include <nodeledger/journal/journal.hpp>

#include <process/owned.hpp>

#include <stout/foreach.hpp>
#include <stout/gtest.hpp>
#include <stout/nothing.hpp>
#include <stout/try.hpp>

#include "common/protobuf_utils.hpp"

#include "journal/node_state_builder.hpp"
#include "journal/transaction_state.hpp"

#include "scheduler/node.hpp"
#include "scheduler/reservation_policy.hpp"

#include "tests/utils.hpp"

using nodeledger::internal::journal::NodeStateBuilder;
using nodeledger::internal::journal::TransactionState;

using nodeledger::internal::scheduler::FairReservationPolicy;
using nodeledger::internal::scheduler::Node;
using nodeledger::internal::scheduler::ReservationPolicy;

using nodeledger::journal::NodeMutation;
using nodeledger::journal::NodeState;
using nodeledger::journal::Transaction;

using process::Owned;

using std::string;
using std::thread;
using std::vector;

namespace nodeledger {
namespace internal {
namespace tests {

TEST(TransactionStateTest, Record)
{
  TransactionState state;

  const NodeID node1 = protobuf::createNodeId("host1", 8041);
  const NodeID node2 = protobuf::createNodeId("host2", 8041);

  const ContainerID containerId =
    protobuf::createContainerId(createAttemptId(1), 1);

  state.record(
      node1,
      protobuf::journal::createUpdateNodeInfo(
          createResources("mem:1024"), createResources("mem:1024"),
          Resources(), 0));
  state.record(node2, protobuf::journal::createRemoveLaunchedContainer(
      containerId));
  state.record(node1, protobuf::journal::createRemoveLaunchedContainer(
      containerId));

  EXPECT_EQ(3u, state.size());

  vector<NodeMutation> mutations = state.mutations(node1);
  ASSERT_EQ(2u, mutations.size());
  EXPECT_EQ(NodeMutation::UPDATE_NODE_INFO, mutations[0].type());
  EXPECT_EQ(NodeMutation::REMOVE_LAUNCHED_CONTAINER, mutations[1].type());

  EXPECT_EQ(1u, state.mutations(node2).size());
  EXPECT_TRUE(state.mutations(protobuf::createNodeId("host3", 1)).empty());

  TransactionState::Mutations committed = state.commit();

  EXPECT_EQ(2u, committed.size());
  EXPECT_EQ(2u, committed[node1].size());
  EXPECT_EQ(1u, committed[node2].size());

  EXPECT_EQ(0u, state.size());
  EXPECT_TRUE(state.mutations(node1).empty());
}


// Nodes journaling into the same transaction from different threads
// keep their own mutations in order.
TEST(TransactionStateTest, Concurrency)
{
  TransactionState state;

  const int nodes = 4;
  const int containersPerNode = 50;

  vector<NodeInfo> infos;
  for (int i = 0; i < nodes; ++i) {
    infos.push_back(
        createNodeInfo("host" + stringify(i), 8041, "cpus:64;mem:65536"));
  }

  vector<thread> workers;

  foreach (const NodeInfo& info, infos) {
    workers.push_back(thread([&state, info, containersPerNode]() {
      Node node(info, false, Owned<ReservationPolicy>(
          new FairReservationPolicy()));

      Transaction transaction(&state);

      for (int i = 1; i <= containersPerNode; ++i) {
        node.allocateContainer(
            createAttemptId(1).application_id(),
            createContainer(info.id(), createAttemptId(1), i, string("mem:1")),
            transaction);
      }
    }));
  }

  foreach (thread& worker, workers) {
    worker.join();
  }

  EXPECT_EQ(
      static_cast<size_t>(nodes * containersPerNode * 2),
      state.size());

  foreach (const NodeInfo& info, infos) {
    NodeStateBuilder builder(info);

    ASSERT_SOME(builder.apply(state.mutations(info.id())));

    EXPECT_EQ(containersPerNode, builder.state().launched_containers_size());
    EXPECT_EQ(
        createResources("mem:" + stringify(containersPerNode)),
        Resources(builder.state().used()));
  }
}


class NodeStateBuilderTest : public ::testing::Test
{
protected:
  NodeStateBuilderTest()
    : info(createNodeInfo("host1", 8041, "cpus:8;mem:8192")),
      builder(info) {}

  Container container(int64_t id, const string& demand)
  {
    return createContainer(info.id(), createAttemptId(1), id, demand);
  }

  const NodeInfo info;
  NodeStateBuilder builder;
};


TEST_F(NodeStateBuilderTest, Initial)
{
  EXPECT_EQ(info.id(), builder.state().node_id());
  EXPECT_EQ(
      createResources("cpus:8;mem:8192"),
      Resources(builder.state().total()));
  EXPECT_EQ(
      createResources("cpus:8;mem:8192"),
      Resources(builder.state().available()));
  EXPECT_TRUE(Resources(builder.state().used()).empty());
  EXPECT_EQ(0, builder.state().launched_containers_size());
  EXPECT_FALSE(builder.state().has_reserved_container());
}


TEST_F(NodeStateBuilderTest, MissingPayload)
{
  NodeMutation mutation;

  mutation.set_type(NodeMutation::UPDATE_NODE_INFO);
  EXPECT_ERROR(builder.apply(mutation));

  mutation.set_type(NodeMutation::ADD_LAUNCHED_CONTAINER);
  EXPECT_ERROR(builder.apply(mutation));

  mutation.set_type(NodeMutation::REMOVE_LAUNCHED_CONTAINER);
  EXPECT_ERROR(builder.apply(mutation));

  mutation.set_type(NodeMutation::UPDATE_RESERVED_CONTAINER);
  EXPECT_ERROR(builder.apply(mutation));

  mutation.set_type(NodeMutation::UNKNOWN);
  EXPECT_ERROR(builder.apply(mutation));
}


TEST_F(NodeStateBuilderTest, Inconsistent)
{
  Container launched = container(1, "mem:1024");

  // Removing a container that was never added.
  EXPECT_ERROR(builder.apply(
      protobuf::journal::createRemoveLaunchedContainer(launched.id())));

  ASSERT_SOME(builder.apply(
      protobuf::journal::createAddLaunchedContainer(launched)));

  // Adding it twice.
  EXPECT_ERROR(builder.apply(
      protobuf::journal::createAddLaunchedContainer(launched)));

  // A snapshot that disagrees with the launched containers.
  EXPECT_ERROR(builder.apply(protobuf::journal::createUpdateNodeInfo(
      createResources("cpus:8;mem:8192"),
      createResources("cpus:8;mem:7168"),
      createResources("mem:1024"),
      2)));

  EXPECT_EQ(1, builder.state().launched_containers_size());
  EXPECT_EQ(
      createResources("cpus:8;mem:8192"),
      Resources(builder.state().available()));
}


TEST_F(NodeStateBuilderTest, StopsAtFirstError)
{
  Container launched = container(1, "mem:1024");

  vector<NodeMutation> mutations;
  mutations.push_back(protobuf::journal::createAddLaunchedContainer(launched));
  mutations.push_back(
      protobuf::journal::createRemoveLaunchedContainer(launched.id()));
  mutations.push_back(
      protobuf::journal::createRemoveLaunchedContainer(launched.id()));
  mutations.push_back(protobuf::journal::createAddLaunchedContainer(
      container(2, "mem:1024")));

  Try<Nothing> applied = builder.apply(mutations);

  ASSERT_ERROR(applied);
  EXPECT_NE(string::npos, applied.error().find("mutation 2"));

  // The mutations before the failing one stay applied.
  EXPECT_EQ(0, builder.state().launched_containers_size());
}


class RecoveryTest : public ::testing::Test
{
protected:
  RecoveryTest()
    : info(createNodeInfo("host1", 8041, "cpus:8;mem:8192")),
      transaction(&state) {}

  Owned<Node> createNode()
  {
    return Owned<Node>(new Node(info, false, Owned<ReservationPolicy>(
        new FairReservationPolicy())));
  }

  Container container(int64_t id, const Option<string>& demand)
  {
    return createContainer(info.id(), createAttemptId(1), id, demand);
  }

  const NodeInfo info;
  TransactionState state;
  const Transaction transaction;
};


// A replica replaying the journal of a node ends up with the same
// view of the node as the scheduler that journaled it.
TEST_F(RecoveryTest, Replay)
{
  Owned<Node> node = createNode();

  const ApplicationAttemptID attempt = createAttemptId(1);

  Container c1 = container(1, string("mem:2048"));
  Container c2 = container(2, string("cpus:1;mem:1024"));
  Container c3 = container(3, None());
  Container c4 = container(4, string("cpus:4;mem:4096"));

  node->allocateContainer(attempt.application_id(), c1, transaction);
  node->allocateContainer(attempt.application_id(), c2, transaction);
  node->allocateContainer(attempt.application_id(), c3, transaction);
  node->releaseContainer(c1, transaction);
  node->updateTotalResource(createResources("cpus:16;mem:16384"), transaction);
  node->reserveResource(
      attempt, protobuf::createPriority(1), c4, transaction);

  NodeStateBuilder builder(info);
  ASSERT_SOME(builder.apply(state.mutations(info.id())));

  const NodeState& recovered = builder.state();

  EXPECT_EQ(node->total(), Resources(recovered.total()));
  EXPECT_EQ(node->available(), Resources(recovered.available()));
  EXPECT_EQ(node->used(), Resources(recovered.used()));
  EXPECT_EQ(node->numContainers(), recovered.launched_containers_size());
  EXPECT_TRUE(recovered.has_reserved_container());
  EXPECT_EQ(c4.id(), recovered.reserved_container().container_id());
  EXPECT_EQ(attempt, recovered.reserved_attempt());

  Owned<Node> replica = createNode();
  ASSERT_SOME(replica->recover(recovered));

  EXPECT_EQ(node->total(), replica->total());
  EXPECT_EQ(node->available(), replica->available());
  EXPECT_EQ(node->used(), replica->used());
  EXPECT_EQ(node->numContainers(), replica->numContainers());
  EXPECT_EQ(node->reservedContainer(), replica->reservedContainer());
  EXPECT_EQ(node->reservedAttempt(), replica->reservedAttempt());
  EXPECT_EQ(node->toString(), replica->toString());

  foreach (const Container& launched, node->runningContainers()) {
    EXPECT_TRUE(replica->launchedContainers().contains(launched.id()));
  }

  // The replica carries on from the recovered state.
  replica->releaseContainer(c2);

  EXPECT_EQ(createResources("cpus:16;mem:16384"), replica->available());
  EXPECT_EQ(1, replica->numContainers());
}


TEST_F(RecoveryTest, UnreserveReplay)
{
  Owned<Node> node = createNode();

  const ApplicationAttemptID attempt = createAttemptId(1);

  node->reserveResource(
      attempt, protobuf::createPriority(1),
      container(1, string("mem:4096")), transaction);
  node->unreserveResource(attempt, transaction);

  NodeStateBuilder builder(info);
  ASSERT_SOME(builder.apply(state.mutations(info.id())));

  EXPECT_FALSE(builder.state().has_reserved_container());
  EXPECT_FALSE(builder.state().has_reserved_attempt());
}


// A container whose demand the ledger skipped on allocation replays
// and recovers the same way rather than failing the recovery.
TEST_F(RecoveryTest, InvalidDemand)
{
  Owned<Node> node = createNode();

  ContainerInfo containerInfo = container(1, string("mem:1024")).info();
  containerInfo.mutable_demand()->mutable_resources(0)->set_value(
      std::numeric_limits<double>::quiet_NaN());

  const Container invalid(containerInfo);

  node->allocateContainer(
      createAttemptId(1).application_id(), invalid, transaction);

  EXPECT_EQ(1, node->numContainers());
  EXPECT_EQ(Resources(), node->used());

  NodeStateBuilder builder(info);
  ASSERT_SOME(builder.apply(state.mutations(info.id())));
  EXPECT_EQ(1, builder.state().launched_containers_size());

  Owned<Node> replica = createNode();
  ASSERT_SOME(replica->recover(builder.state()));

  EXPECT_EQ(1, replica->numContainers());
  EXPECT_EQ(Resources(), replica->used());
  EXPECT_EQ(node->available(), replica->available());
  EXPECT_TRUE(replica->launchedContainers().contains(invalid.id()));

  replica->releaseContainer(invalid);

  EXPECT_EQ(0, replica->numContainers());
  EXPECT_EQ(Resources(), replica->used());
  EXPECT_EQ(replica->total(), replica->available());
}


TEST_F(RecoveryTest, OtherNode)
{
  Owned<Node> node = createNode();

  node->allocateContainer(
      createAttemptId(1).application_id(),
      container(1, string("mem:1024")));

  NodeStateBuilder builder(createNodeInfo("host2", 8041, "mem:1024"));

  EXPECT_ERROR(node->recover(builder.state()));

  // The node is left untouched.
  EXPECT_EQ(1, node->numContainers());
  EXPECT_EQ(createResources("mem:1024"), node->used());
}


TEST_F(RecoveryTest, DuplicateContainer)
{
  Owned<Node> node = createNode();

  NodeState recovered = NodeStateBuilder(info).state();

  Container launched = container(1, string("mem:1024"));
  recovered.add_launched_containers()->CopyFrom(launched.info());
  recovered.add_launched_containers()->CopyFrom(launched.info());

  EXPECT_ERROR(node->recover(recovered));
  EXPECT_EQ(0, node->numContainers());
}

} // namespace tests {
} // namespace internal {
} // namespace nodeledger {
