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

#ifndef __NODELEDGER_HPP__
#define __NODELEDGER_HPP__

#include <ostream>

#include <boost/functional/hash.hpp>

#include <nodeledger/nodeledger.pb.h> // ONLY USEFUL AFTER RUNNING PROTOC.

namespace nodeledger {

inline bool operator==(const NodeID& left, const NodeID& right)
{
  return left.host() == right.host() && left.port() == right.port();
}


inline bool operator==(const ApplicationID& left, const ApplicationID& right)
{
  return left.cluster_timestamp() == right.cluster_timestamp() &&
         left.id() == right.id();
}


inline bool operator==(
    const ApplicationAttemptID& left,
    const ApplicationAttemptID& right)
{
  return left.application_id() == right.application_id() &&
         left.attempt_id() == right.attempt_id();
}


inline bool operator==(const ContainerID& left, const ContainerID& right)
{
  return left.application_attempt_id() == right.application_attempt_id() &&
         left.id() == right.id();
}


inline bool operator==(const Priority& left, const Priority& right)
{
  return left.priority() == right.priority();
}


inline bool operator!=(const NodeID& left, const NodeID& right)
{
  return !(left == right);
}


inline bool operator!=(const ApplicationID& left, const ApplicationID& right)
{
  return !(left == right);
}


inline bool operator!=(
    const ApplicationAttemptID& left,
    const ApplicationAttemptID& right)
{
  return !(left == right);
}


inline bool operator!=(const ContainerID& left, const ContainerID& right)
{
  return !(left == right);
}


// Formats the identifiers the same way the cluster manager prints
// them, e.g., "container_1400000000000_0001_01_000002".
std::ostream& operator<<(std::ostream& stream, const NodeID& nodeId);


std::ostream& operator<<(
    std::ostream& stream,
    const ApplicationID& applicationId);


std::ostream& operator<<(
    std::ostream& stream,
    const ApplicationAttemptID& applicationAttemptId);


std::ostream& operator<<(
    std::ostream& stream,
    const ContainerID& containerId);


std::ostream& operator<<(std::ostream& stream, const Priority& priority);

} // namespace nodeledger {

namespace std {

template <>
struct hash<nodeledger::NodeID>
{
  typedef size_t result_type;

  typedef nodeledger::NodeID argument_type;

  result_type operator()(const argument_type& nodeId) const
  {
    size_t seed = 0;
    boost::hash_combine(seed, nodeId.host());
    boost::hash_combine(seed, nodeId.port());
    return seed;
  }
};


template <>
struct hash<nodeledger::ApplicationID>
{
  typedef size_t result_type;

  typedef nodeledger::ApplicationID argument_type;

  result_type operator()(const argument_type& applicationId) const
  {
    size_t seed = 0;
    boost::hash_combine(seed, applicationId.cluster_timestamp());
    boost::hash_combine(seed, applicationId.id());
    return seed;
  }
};


template <>
struct hash<nodeledger::ApplicationAttemptID>
{
  typedef size_t result_type;

  typedef nodeledger::ApplicationAttemptID argument_type;

  result_type operator()(const argument_type& applicationAttemptId) const
  {
    size_t seed = 0;
    boost::hash_combine(
        seed,
        std::hash<nodeledger::ApplicationID>()(
            applicationAttemptId.application_id()));
    boost::hash_combine(seed, applicationAttemptId.attempt_id());
    return seed;
  }
};


template <>
struct hash<nodeledger::ContainerID>
{
  typedef size_t result_type;

  typedef nodeledger::ContainerID argument_type;

  result_type operator()(const argument_type& containerId) const
  {
    size_t seed = 0;
    boost::hash_combine(
        seed,
        std::hash<nodeledger::ApplicationAttemptID>()(
            containerId.application_attempt_id()));
    boost::hash_combine(seed, containerId.id());
    return seed;
  }
};

} // namespace std {

#endif // __NODELEDGER_HPP__
