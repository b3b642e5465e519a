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

#ifndef __SCHEDULER_VALIDATION_HPP__
#define __SCHEDULER_VALIDATION_HPP__

#include <nodeledger/nodeledger.hpp>

#include <stout/error.hpp>
#include <stout/option.hpp>

namespace nodeledger {
namespace internal {
namespace scheduler {
namespace validation {

namespace node {

// Validates the descriptor a node is created from: the id and hostname
// must be set and the total capability must be finite and
// non-negative.
Option<Error> validate(const NodeInfo& info);

} // namespace node {

namespace container {

// Validates that a container descriptor carries its required fields.
// The demand is not checked: the ledger skips a demand that is not
// finite, so a recorded container must replay the same way.
Option<Error> validate(const ContainerInfo& info);

} // namespace container {

} // namespace validation {
} // namespace scheduler {
} // namespace internal {
} // namespace nodeledger {

#endif // __SCHEDULER_VALIDATION_HPP__
