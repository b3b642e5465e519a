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

#include <glog/logging.h>

#include <stout/error.hpp>

#include "scheduler/resource_ledger.hpp"

using std::string;

namespace nodeledger {
namespace internal {
namespace scheduler {

// NOTE: `total` is copied into both `total_` and `available_`, the two
// never share storage.
ResourceLedger::ResourceLedger(const string& _node, const Resources& total)
  : node(_node),
    total_(total),
    available_(total) {}


void ResourceLedger::allocate(const Option<Resources>& resources)
{
  if (!isValid(resources, "deduction")) {
    return;
  }

  available_ -= resources.get();
  used_ += resources.get();
}


void ResourceLedger::release(const Option<Resources>& resources)
{
  if (!isValid(resources, "addition")) {
    return;
  }

  available_ += resources.get();
  used_ -= resources.get();
}


void ResourceLedger::applyTotalCapacityDelta(const Resources& delta)
{
  available_ += delta;
}


void ResourceLedger::updateTotal(const Resources& total)
{
  total_ = total;
  available_ = total - used_;
}


void ResourceLedger::reset(
    const Resources& total,
    const Resources& available,
    const Resources& used)
{
  total_ = total;
  available_ = available;
  used_ = used;
}


bool ResourceLedger::isValid(
    const Option<Resources>& resources,
    const char* action) const
{
  if (resources.isNone()) {
    LOG(ERROR) << "Invalid " << action << " of null resources for " << node;
    return false;
  }

  Option<Error> error = resources->validate();
  if (error.isSome()) {
    LOG(ERROR) << "Invalid " << action << " of resources " << resources.get()
               << " for " << node << ": " << error->message;
    return false;
  }

  return true;
}

} // namespace scheduler {
} // namespace internal {
} // namespace nodeledger {
