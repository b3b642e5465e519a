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

#include <signal.h>
#include <stdlib.h>

#include <glog/logging.h>
#include <glog/raw_logging.h>

#include <iostream>
#include <string>

#include <process/once.hpp>

#include <stout/error.hpp>
#include <stout/nothing.hpp>
#include <stout/os.hpp>
#include <stout/try.hpp>

#include <stout/os/signals.hpp>

#include "logging/logging.hpp"

using process::Once;

using std::cerr;
using std::endl;
using std::string;

namespace nodeledger {
namespace internal {
namespace logging {

// glog keeps the pointer passed to `InitGoogleLogging()`.
static string argv0;


// A scheduler being stopped is not a crash: log who sent SIGTERM and
// exit through the default disposition instead of letting glog's
// failure handler dump a stack trace.
//
// NOTE: Only async-signal-safe calls are allowed here, hence RAW_LOG.
static void terminated(int signal, siginfo_t* siginfo, void*)
{
  if (signal != SIGTERM) {
    RAW_LOG(FATAL, "Unexpected signal %d", signal);
  }

  if (siginfo->si_code <= 0 ||
      siginfo->si_code == SI_USER ||
      siginfo->si_code == SI_QUEUE) {
    RAW_LOG(WARNING, "Terminated by process %d of user %d",
            siginfo->si_pid, siginfo->si_uid);
  } else {
    RAW_LOG(WARNING, "Terminated");
  }

  os::signals::reset(signal);
  raise(signal);
}


static Try<Nothing> logToDirectory(const string& directory)
{
  Try<Nothing> mkdir = os::mkdir(directory);
  if (mkdir.isError()) {
    return Error(
        "Failed to create log directory '" + directory + "': " +
        mkdir.error());
  }

  FLAGS_log_dir = directory;
  FLAGS_logtostderr = false;

  return Nothing();
}


google::LogSeverity getLogSeverity(const string& logging_level)
{
  if (logging_level == "WARNING") {
    return google::WARNING;
  } else if (logging_level == "ERROR") {
    return google::ERROR;
  }

  // The flag validator only lets through INFO otherwise.
  return google::INFO;
}


void initialize(
    const string& _argv0,
    const Flags& flags,
    bool installFailureSignalHandler)
{
  static Once* initialized = new Once();

  if (initialized->once()) {
    return;
  }

  argv0 = _argv0;

  FLAGS_v = flags.verbosity;
  FLAGS_logbufsecs = flags.logbufsecs;
  FLAGS_minloglevel = getLogSeverity(flags.logging_level);
  FLAGS_logtostderr = true;

  if (flags.log_dir.isSome()) {
    Try<Nothing> directory = logToDirectory(flags.log_dir.get());
    if (directory.isError()) {
      cerr << "Could not initialize logging: " << directory.error() << endl;
      exit(EXIT_FAILURE);
    }
  }

  if (!flags.quiet) {
    FLAGS_stderrthreshold = FLAGS_minloglevel;
  } else if (FLAGS_logtostderr) {
    // With everything going to stderr the threshold is ignored, so
    // raise the minimum level instead.
    FLAGS_minloglevel = google::FATAL;
  } else {
    FLAGS_stderrthreshold = google::FATAL;
  }

  google::InitGoogleLogging(argv0.c_str());

  VLOG(1) << "Logging to "
          << (flags.log_dir.isSome() ? flags.log_dir.get() : "stderr")
          << " at level " << flags.logging_level
          << " with verbosity " << flags.verbosity;

  if (installFailureSignalHandler) {
    google::InstallFailureSignalHandler();

    // Replaces glog's handler for SIGTERM only.
    struct sigaction action;
    action.sa_sigaction = terminated;
    action.sa_flags = SA_SIGINFO;
    sigemptyset(&action.sa_mask);

    if (sigaction(SIGTERM, &action, nullptr) < 0) {
      PLOG(FATAL) << "Failed to install the SIGTERM handler";
    }
  }

  initialized->done();
}

} // namespace logging {
} // namespace internal {
} // namespace nodeledger {
