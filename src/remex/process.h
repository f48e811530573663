#ifndef REMEX_PROCESS_H_
#define REMEX_PROCESS_H_

#include <string>
#include <vector>
#include <sys/types.h>

class ProcessOptions {
 public:
  std::vector<std::string> command; // command[0] is looked up on PATH
  std::vector<std::string> envs; // KEY=VALUE; overrides the inherited environment
  bool channel; // hand the write end of a result pipe to the child as fd 3
  long wall_time; // ms; 0 for no limit
  long drain_grace; // us spent salvaging output after a kill
  size_t max_output; // bytes kept per stdout/stderr; the channel is unbounded

  ProcessOptions() :
      channel(false),
      wall_time(0),
      drain_grace(1000),
      max_output(4 << 20) {}
};

struct ProcessResult {
  int error; // errno if spawning or polling failed
  bool timed_out;
  bool drained; // stdout/stderr (and channel) were read to EOF
  int exit_code; // -1 if killed by a signal or never started
  int term_signal;
  long wall_time; // us
  std::string out, err, channel;

  ProcessResult() :
      error(0), timed_out(false), drained(false),
      exit_code(-1), term_signal(0), wall_time(0) {}
};

// Owns a child running in its own process group. Kill and reap happen at
// most once; Teardown can be called any number of times.
class ChildProcess {
  pid_t pid_;
  bool reaped_;
  int status_;
 public:
  ChildProcess() : pid_(-1), reaped_(false), status_(0) {}
  ChildProcess(const ChildProcess&) = delete;
  ChildProcess& operator=(const ChildProcess&) = delete;
  ~ChildProcess() { Teardown(); }

  void Attach(pid_t pid) { pid_ = pid; reaped_ = false; }
  pid_t pid() const { return pid_; }
  bool running() const { return pid_ > 0 && !reaped_; }
  int status() const { return status_; }

  // signal the whole group
  void Kill(int sig);
  // non-blocking; true once the child has been reaped
  bool TryReap();
  void Reap();
  // SIGKILL the group and reap if still running
  void Teardown();
};

ProcessResult RunProcess(const ProcessOptions&);

#endif  // REMEX_PROCESS_H_
