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

#ifndef __SCHEDULER_CONSTANTS_HPP__
#define __SCHEDULER_CONSTANTS_HPP__

namespace nodeledger {
namespace internal {
namespace scheduler {

// Names of the built-in reservation policies.
constexpr char CAPACITY_RESERVATION_POLICY[] = "capacity";
constexpr char FAIR_RESERVATION_POLICY[] = "fair";
constexpr char NO_RESERVATION_POLICY[] = "none";

constexpr char DEFAULT_RESERVATION_POLICY[] = "capacity";

// Whether the name a node is matched by during scheduling includes
// the agent's port. Off by default; mostly useful when several agents
// share a host.
constexpr bool DEFAULT_INCLUDE_PORT_IN_NODE_NAME = false;

// Prefix of the environment variables flags are loaded from.
constexpr char FLAGS_ENVIRONMENT_PREFIX[] = "NODELEDGER_";

} // namespace scheduler {
} // namespace internal {
} // namespace nodeledger {

#endif // __SCHEDULER_CONSTANTS_HPP__
