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

#include <stout/foreach.hpp>

#include "scheduler/container_registry.hpp"

using std::vector;

namespace nodeledger {
namespace internal {
namespace scheduler {

bool ContainerRegistry::add(const Container& container)
{
  if (containers.contains(container.id())) {
    return false;
  }

  containers.put(container.id(), container);
  return true;
}


bool ContainerRegistry::remove(const ContainerID& containerId)
{
  return containers.erase(containerId) > 0;
}


vector<Container> ContainerRegistry::snapshot() const
{
  vector<Container> result;
  result.reserve(containers.size());

  foreachvalue (const Container& container, containers) {
    result.push_back(container);
  }

  return result;
}

} // namespace scheduler {
} // namespace internal {
} // namespace nodeledger {
