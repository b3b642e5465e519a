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

#include "logging/flags.hpp"

using std::string;

namespace nodeledger {
namespace internal {
namespace logging {

Flags::Flags()
{
  add(&Flags::quiet,
      "quiet",
      "Do not log to stderr.",
      false);

  add(&Flags::logging_level,
      "logging_level",
      "Lowest severity that is logged, one of `INFO`, `WARNING`\n"
      "and `ERROR`. With `--quiet` this only applies to the files\n"
      "in `--log_dir`.",
      "INFO",
      [](const string& value) -> Option<Error> {
        if (value != "INFO" && value != "WARNING" && value != "ERROR") {
          return Error("Unknown logging level '" + value + "'");
        }
        return None();
      });

  add(&Flags::verbosity,
      "verbosity",
      "Verbose logging level. At 1 every capacity change and journal\n"
      "commit is logged, at 2 every journaled mutation as well.",
      0,
      [](int value) -> Option<Error> {
        if (value < 0) {
          return Error("Expected a non-negative verbosity");
        }
        return None();
      });

  add(&Flags::log_dir,
      "log_dir",
      "Directory to write log files to, in addition to stderr.\n"
      "Nothing is written to disk if unset.");

  add(&Flags::logbufsecs,
      "logbufsecs",
      "Seconds log messages may be buffered for before being flushed.",
      0);
}

} // namespace logging {
} // namespace internal {
} // namespace nodeledger {
