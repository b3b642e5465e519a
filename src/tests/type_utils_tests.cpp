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

#include <iomanip>
#include <sstream>
#include <string>

#include <gtest/gtest.h>

#include <nodeledger/container.hpp>
#include <nodeledger/nodeledger.hpp>
#include <nodeledger/resources.hpp>

#include <stout/gtest.hpp>
#include <stout/hashset.hpp>
#include <stout/stringify.hpp>

#include "tests/utils.hpp"

using std::ostringstream;
using std::string;

namespace nodeledger {
namespace internal {
namespace tests {

TEST(TypeUtilsTest, Stringify)
{
  const NodeID nodeId = protobuf::createNodeId("host1", 8041);
  const ApplicationAttemptID attemptId = createAttemptId(7, 2);

  EXPECT_EQ("host1:8041", stringify(nodeId));
  EXPECT_EQ(
      "application_1400000000000_0007",
      stringify(attemptId.application_id()));
  EXPECT_EQ("appattempt_1400000000000_0007_000002", stringify(attemptId));
  EXPECT_EQ(
      "container_1400000000000_0007_02_000042",
      stringify(protobuf::createContainerId(attemptId, 42)));

  // Wider numbers are not truncated.
  EXPECT_EQ(
      "application_1400000000000_12345",
      stringify(protobuf::createApplicationId(CLUSTER_TIMESTAMP, 12345)));

  EXPECT_EQ(
      "container_1400000000000_0007_02_000042",
      stringify(createContainer(nodeId, attemptId, 42, None())));

  EXPECT_EQ("3", stringify(protobuf::createPriority(3)));
}


// The zero padding of ids does not leak into what follows.
TEST(TypeUtilsTest, Fill)
{
  ostringstream out;
  out << createAttemptId(1) << " " << std::setw(3) << 7;

  EXPECT_EQ("appattempt_1400000000000_0001_000001   7", out.str());
}


TEST(TypeUtilsTest, Equality)
{
  const ApplicationAttemptID attemptId = createAttemptId(1);

  EXPECT_EQ(
      protobuf::createContainerId(attemptId, 1),
      protobuf::createContainerId(attemptId, 1));
  EXPECT_NE(
      protobuf::createContainerId(attemptId, 1),
      protobuf::createContainerId(attemptId, 2));
  EXPECT_NE(
      protobuf::createContainerId(attemptId, 1),
      protobuf::createContainerId(createAttemptId(1, 2), 1));
  EXPECT_NE(createAttemptId(1), createAttemptId(2));

  EXPECT_EQ(
      protobuf::createNodeId("host1", 8041),
      protobuf::createNodeId("host1", 8041));
  EXPECT_NE(
      protobuf::createNodeId("host1", 8041),
      protobuf::createNodeId("host1", 8042));

  // Containers are the same container if their ids are, whatever
  // they demand.
  const NodeID nodeId = protobuf::createNodeId("host1", 8041);

  EXPECT_EQ(
      createContainer(nodeId, attemptId, 1, string("mem:1024")),
      createContainer(nodeId, attemptId, 1, string("mem:2048")));
}


TEST(TypeUtilsTest, Container)
{
  const NodeID nodeId = protobuf::createNodeId("host1", 8041);
  const ApplicationAttemptID attemptId = createAttemptId(3, 2);

  Container container =
    createContainer(nodeId, attemptId, 5, string("cpus:1;mem:512"));

  EXPECT_EQ(protobuf::createContainerId(attemptId, 5), container.id());
  EXPECT_EQ(attemptId, container.applicationAttemptId());
  EXPECT_EQ(attemptId.application_id(), container.applicationId());
  EXPECT_EQ(nodeId, container.nodeId());
  EXPECT_SOME_EQ(protobuf::createPriority(1), container.priority());
  ASSERT_SOME(container.resources());
  EXPECT_EQ(1, container.resources()->cpus());
  EXPECT_EQ(512, container.resources()->memory());

  // Absent and empty demands are told apart.
  EXPECT_NONE(createContainer(nodeId, attemptId, 6, None()).resources());

  Container empty(protobuf::createContainerInfo(
      protobuf::createContainerId(attemptId, 7), nodeId, Resources()));

  ASSERT_SOME(empty.resources());
  EXPECT_TRUE(empty.resources()->empty());
  EXPECT_NONE(empty.priority());
}


TEST(TypeUtilsTest, Hash)
{
  const ApplicationAttemptID attemptId = createAttemptId(1);

  hashset<ContainerID> containerIds;
  containerIds.insert(protobuf::createContainerId(attemptId, 1));
  containerIds.insert(protobuf::createContainerId(attemptId, 2));
  containerIds.insert(protobuf::createContainerId(attemptId, 1));

  EXPECT_EQ(2u, containerIds.size());
  EXPECT_TRUE(containerIds.contains(protobuf::createContainerId(attemptId, 2)));

  hashset<NodeID> nodeIds;
  nodeIds.insert(protobuf::createNodeId("host1", 8041));
  nodeIds.insert(protobuf::createNodeId("host1", 8042));
  nodeIds.insert(protobuf::createNodeId("host1", 8041));

  EXPECT_EQ(2u, nodeIds.size());
}

} // namespace tests {
} // namespace internal {
} // namespace nodeledger {
