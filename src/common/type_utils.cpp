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
#include <ostream>

#include <nodeledger/nodeledger.hpp>

using std::ostream;
using std::setfill;
using std::setw;

namespace nodeledger {

ostream& operator<<(ostream& stream, const NodeID& nodeId)
{
  return stream << nodeId.host() << ":" << nodeId.port();
}


// NOTE: The zero padded fields must not leak the fill character into
// whatever the caller streams next, hence the explicit resets.
ostream& operator<<(ostream& stream, const ApplicationID& applicationId)
{
  const char fill = stream.fill();

  stream << "application_" << applicationId.cluster_timestamp() << "_"
         << setfill('0') << setw(4) << applicationId.id();

  stream.fill(fill);
  return stream;
}


ostream& operator<<(
    ostream& stream,
    const ApplicationAttemptID& applicationAttemptId)
{
  const ApplicationID& applicationId = applicationAttemptId.application_id();
  const char fill = stream.fill();

  stream << "appattempt_" << applicationId.cluster_timestamp() << "_"
         << setfill('0') << setw(4) << applicationId.id() << "_"
         << setw(6) << applicationAttemptId.attempt_id();

  stream.fill(fill);
  return stream;
}


ostream& operator<<(ostream& stream, const ContainerID& containerId)
{
  const ApplicationAttemptID& applicationAttemptId =
    containerId.application_attempt_id();

  const ApplicationID& applicationId = applicationAttemptId.application_id();
  const char fill = stream.fill();

  stream << "container_" << applicationId.cluster_timestamp() << "_"
         << setfill('0') << setw(4) << applicationId.id() << "_"
         << setw(2) << applicationAttemptId.attempt_id() << "_"
         << setw(6) << containerId.id();

  stream.fill(fill);
  return stream;
}


ostream& operator<<(ostream& stream, const Priority& priority)
{
  return stream << priority.priority();
}

} // namespace nodeledger {
