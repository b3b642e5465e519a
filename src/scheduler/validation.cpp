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

#include <nodeledger/resources.hpp>

#include <stout/foreach.hpp>
#include <stout/stringify.hpp>

#include "scheduler/validation.hpp"

using std::string;

namespace nodeledger {
namespace internal {
namespace scheduler {
namespace validation {

namespace node {

Option<Error> validate(const NodeInfo& info)
{
  if (!info.IsInitialized()) {
    return Error(
        "Node descriptor is missing required fields: " +
        info.InitializationErrorString());
  }

  if (info.id().host().empty()) {
    return Error("Node id has an empty host");
  }

  if (info.id().port() < 0 || info.id().port() > 65535) {
    return Error("Node id has an invalid port " + stringify(info.id().port()));
  }

  if (info.hostname().empty()) {
    return Error("Node " + stringify(info.id()) + " has an empty hostname");
  }

  const Resources total = info.total_capability();

  Option<Error> error = total.validate();
  if (error.isSome()) {
    return Error(
        "Node " + stringify(info.id()) + " has an invalid total capability: " +
        error->message);
  }

  foreach (const auto& quantity, total) {
    if (quantity.second < 0) {
      return Error(
          "Node " + stringify(info.id()) + " has a negative total capability"
          " of '" + quantity.first + "'");
    }
  }

  return None();
}

} // namespace node {

namespace container {

Option<Error> validate(const ContainerInfo& info)
{
  if (!info.IsInitialized()) {
    return Error(
        "Container descriptor is missing required fields: " +
        info.InitializationErrorString());
  }

  return None();
}

} // namespace container {

} // namespace validation {
} // namespace scheduler {
} // namespace internal {
} // namespace nodeledger {
