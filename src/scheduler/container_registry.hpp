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

#ifndef __SCHEDULER_CONTAINER_REGISTRY_HPP__
#define __SCHEDULER_CONTAINER_REGISTRY_HPP__

#include <vector>

#include <nodeledger/container.hpp>
#include <nodeledger/nodeledger.hpp>

#include <stout/hashmap.hpp>
#include <stout/option.hpp>

namespace nodeledger {
namespace internal {
namespace scheduler {

// The containers currently occupying a node, keyed by container id.
//
// NOTE: Not thread-safe, the owning `Node` serializes access.
class ContainerRegistry
{
public:
  typedef hashmap<ContainerID, Container> Containers;

  // Registers the container. Returns false, leaving the registry
  // untouched, if a container with the same id is already present.
  bool add(const Container& container);

  // Returns whether a container with the given id was registered.
  bool remove(const ContainerID& containerId);

  bool contains(const ContainerID& containerId) const
  {
    return containers.contains(containerId);
  }

  Option<Container> get(const ContainerID& containerId) const
  {
    return containers.get(containerId);
  }

  size_t size() const { return containers.size(); }

  // Returns a copy of the registered containers that the caller may
  // keep for as long as it wants.
  std::vector<Container> snapshot() const;

  // Returns the live map backing the registry. Callers must not hold
  // on to it beyond the owning node's lock scope.
  Containers& view() { return containers; }
  const Containers& view() const { return containers; }

private:
  Containers containers;
};

} // namespace scheduler {
} // namespace internal {
} // namespace nodeledger {

#endif // __SCHEDULER_CONTAINER_REGISTRY_HPP__
