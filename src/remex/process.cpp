#include "process.h"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <unistd.h>
#include <sys/wait.h>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <thread>

#include <fmt/ranges.h>
#include <spdlog/spdlog.h>
#include "utils.h"

extern char** environ;

namespace {

using Clock = std::chrono::steady_clock;

class ScopedFd {
  int fd_;
 public:
  explicit ScopedFd(int fd = -1) : fd_(fd) {}
  ScopedFd(ScopedFd&& x) : fd_(x.fd_) { x.fd_ = -1; }
  ScopedFd& operator=(ScopedFd&& x) {
    if (this != &x) {
      Close();
      fd_ = x.fd_;
      x.fd_ = -1;
    }
    return *this;
  }
  ~ScopedFd() { Close(); }
  int get() const { return fd_; }
  void Close() {
    if (fd_ >= 0) close(fd_);
    fd_ = -1;
  }
};

struct Pipe {
  ScopedFd read, write;
  bool Open() {
    int fds[2];
    if (pipe2(fds, O_CLOEXEC) < 0) return false;
    read = ScopedFd(fds[0]);
    write = ScopedFd(fds[1]);
    return fcntl(read.get(), F_SETFL, O_NONBLOCK) == 0;
  }
};

// only async-signal-safe calls; runs between fork and exec
bool MoveFd(int from, int to) {
  if (from == to) return fcntl(to, F_SETFD, 0) == 0;
  return dup2(from, to) == to;
}

std::vector<std::string> BuildEnv(const std::vector<std::string>& overrides) {
  std::vector<std::string> ret;
  for (char** env = environ; env && *env; env++) {
    std::string entry = *env;
    std::string key = entry.substr(0, entry.find('='));
    bool overridden = false;
    for (auto& i : overrides) {
      if (i.compare(0, key.size() + 1, key + "=") == 0) {
        overridden = true;
        break;
      }
    }
    if (!overridden) ret.push_back(std::move(entry));
  }
  ret.insert(ret.end(), overrides.begin(), overrides.end());
  return ret;
}

long ElapsedUs(Clock::time_point start) {
  return std::chrono::duration_cast<std::chrono::microseconds>(Clock::now() - start).count();
}

struct Stream {
  int fd;
  std::string* buf;
  size_t limit; // 0 for unbounded
};

// read whatever is available; false on EOF or a read error
bool ReadAvailable(const Stream& stream) {
  char buf[65536];
  while (true) {
    ssize_t n = read(stream.fd, buf, sizeof(buf));
    if (n > 0) {
      size_t keep = n;
      if (stream.limit && stream.buf->size() + keep > stream.limit) {
        keep = stream.buf->size() < stream.limit ? stream.limit - stream.buf->size() : 0;
      }
      stream.buf->append(buf, keep);
      continue;
    }
    if (n == 0) return false;
    if (errno == EINTR) continue;
    return errno == EAGAIN || errno == EWOULDBLOCK;
  }
}

// Poll the open streams until all reach EOF or the deadline passes.
// Returns false if the deadline passed first.
bool PollStreams(std::vector<Stream>& streams, Clock::time_point deadline, bool has_deadline, int& error) {
  while (!streams.empty()) {
    struct timespec ts{}, *tsp = nullptr;
    if (has_deadline) {
      auto left = std::chrono::duration_cast<std::chrono::nanoseconds>(deadline - Clock::now()).count();
      if (left <= 0) return false;
      ts.tv_sec = left / 1'000'000'000;
      ts.tv_nsec = left % 1'000'000'000;
      tsp = &ts;
    }
    std::vector<struct pollfd> pfds;
    for (auto& i : streams) pfds.push_back({i.fd, POLLIN, 0});
    int r = ppoll(pfds.data(), pfds.size(), tsp, nullptr);
    if (r < 0) {
      if (errno == EINTR) continue;
      error = errno;
      return true;
    }
    std::vector<Stream> still_open;
    for (size_t i = 0; i < streams.size(); i++) {
      if (pfds[i].revents && !ReadAvailable(streams[i])) continue;
      still_open.push_back(streams[i]);
    }
    streams.swap(still_open);
  }
  return true;
}

} // namespace

void ChildProcess::Kill(int sig) {
  if (!running()) return;
  if (killpg(pid_, sig) < 0 && errno != ESRCH) {
    spdlog::warn("killpg pid={} sig={} failed: {}", pid_, sig, strerror(errno));
  }
}

bool ChildProcess::TryReap() {
  if (!running()) return true;
  pid_t r = waitpid(pid_, &status_, WNOHANG);
  if (r == pid_ || (r < 0 && errno == ECHILD)) {
    reaped_ = true;
    spdlog::debug("Reaped pid={} status={}", pid_, status_);
  }
  return reaped_;
}

void ChildProcess::Reap() {
  while (running()) {
    pid_t r = waitpid(pid_, &status_, 0);
    if (r == pid_ || (r < 0 && errno != EINTR)) {
      reaped_ = true;
      spdlog::debug("Reaped pid={} status={}", pid_, status_);
    }
  }
}

void ChildProcess::Teardown() {
  if (!running()) return;
  Kill(SIGKILL);
  Reap();
}

ProcessResult RunProcess(const ProcessOptions& opt) {
  ProcessResult ret;
  if (opt.command.empty()) {
    ret.error = EINVAL;
    return ret;
  }
  fs::path exe = FindExecutable(opt.command[0]);
  if (exe.empty()) {
    spdlog::warn("{} not found in PATH", opt.command[0]);
    ret.error = ENOENT;
    return ret;
  }

  // everything the child touches is prepared before fork
  std::vector<char*> argv;
  for (auto& i : opt.command) argv.push_back(const_cast<char*>(i.c_str()));
  argv.push_back(nullptr);
  std::vector<std::string> env_buf = BuildEnv(opt.envs);
  std::vector<char*> envp;
  for (auto& i : env_buf) envp.push_back(const_cast<char*>(i.c_str()));
  envp.push_back(nullptr);

  Pipe out, err, chan;
  ScopedFd devnull(open("/dev/null", O_RDONLY | O_CLOEXEC));
  if (devnull.get() < 0 || !out.Open() || !err.Open() || (opt.channel && !chan.Open())) {
    ret.error = errno;
    spdlog::warn("RunProcess setup error: errno={} {}", errno, strerror(errno));
    return ret;
  }

  auto start = Clock::now();
  ChildProcess child;
  pid_t pid = fork();
  if (pid < 0) {
    ret.error = errno;
    spdlog::warn("fork failed: errno={} {}", errno, strerror(errno));
    return ret;
  }
  if (pid == 0) {
    setpgid(0, 0);
    sigset_t empty;
    sigemptyset(&empty);
    sigprocmask(SIG_SETMASK, &empty, nullptr);
    signal(SIGPIPE, SIG_DFL);
    if (!MoveFd(devnull.get(), 0) || !MoveFd(out.write.get(), 1) || !MoveFd(err.write.get(), 2)) _exit(126);
    if (opt.channel && !MoveFd(chan.write.get(), 3)) _exit(126);
    CloseFrom(opt.channel ? 4 : 3);
    execve(exe.c_str(), argv.data(), envp.data());
    _exit(127);
  }
  // racing the child's own setpgid so killpg never misses
  setpgid(pid, pid);
  child.Attach(pid);
  spdlog::debug("Spawned pid={} command={} deadline={}ms", pid, fmt::format("{}", opt.command), opt.wall_time);
  out.write.Close();
  err.write.Close();
  chan.write.Close();
  devnull.Close();

  std::vector<Stream> streams = {
    {out.read.get(), &ret.out, opt.max_output},
    {err.read.get(), &ret.err, opt.max_output},
  };
  if (opt.channel) streams.push_back({chan.read.get(), &ret.channel, 0});

  bool has_deadline = opt.wall_time > 0;
  auto deadline = start + std::chrono::milliseconds(opt.wall_time);
  bool finished = PollStreams(streams, deadline, has_deadline, ret.error);
  // streams closed but the child may still be running
  while (finished && !child.TryReap()) {
    if (has_deadline && Clock::now() >= deadline) {
      finished = false;
      break;
    }
    std::this_thread::sleep_for(std::chrono::microseconds(500));
  }

  if (!finished) {
    ret.timed_out = true;
    child.Kill(SIGKILL);
    auto grace = Clock::now() + std::chrono::microseconds(opt.drain_grace);
    int drain_error = 0;
    ret.drained = PollStreams(streams, grace, true, drain_error) && !drain_error;
    if (!ret.drained) {
      child.Kill(SIGTERM);
      ret.out.clear();
      ret.err.clear();
    }
    child.Reap();
    spdlog::debug("pid={} timed out after {}ms, drained={}", pid, opt.wall_time, ret.drained);
  } else {
    ret.drained = !ret.error;
  }
  child.Reap();
  ret.wall_time = ElapsedUs(start);
  int status = child.status();
  if (WIFEXITED(status)) {
    ret.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    ret.term_signal = WTERMSIG(status);
  }
  return ret;
}
