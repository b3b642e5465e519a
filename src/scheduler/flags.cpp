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

#include <stout/flags.hpp>

#include "scheduler/constants.hpp"
#include "scheduler/flags.hpp"

using std::string;

nodeledger::internal::scheduler::Flags::Flags()
{
  add(&Flags::include_port_in_node_name,
      "include_port_in_node_name",
      "Whether the name a node is matched by during scheduling is\n"
      "`hostname:port` rather than just `hostname`. Enable this when\n"
      "several node agents run on the same host.",
      DEFAULT_INCLUDE_PORT_IN_NODE_NAME);

  add(&Flags::reservation_policy,
      "reservation_policy",
      "How a node holds capacity for a request that does not fit yet.\n"
      "Possible values: `capacity` (hold the slot for the container),\n"
      "`fair` (hold the slot and remember the reserving attempt),\n"
      "`none` (never reserve).",
      DEFAULT_RESERVATION_POLICY,
      [](const string& value) -> Option<Error> {
        if (value != CAPACITY_RESERVATION_POLICY &&
            value != FAIR_RESERVATION_POLICY &&
            value != NO_RESERVATION_POLICY) {
          return Error("Unknown reservation policy '" + value + "'");
        }
        return None();
      });
}
