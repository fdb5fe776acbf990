/* MIT License
 *
 * Copyright (c) 2024 Andrew D Smith
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

#include "invocation_runner.hpp"

#include "find_path_to_binary.hpp"
#include "logger.hpp"

#include <boost/asio.hpp>

#include <fcntl.h>      // for open, O_CLOEXEC
#include <sys/types.h>  // for pid_t
#include <sys/wait.h>   // for waitpid
#include <unistd.h>     // for fork, execve, pipe2, dup2, _exit

#include <array>
#include <cerrno>
#include <chrono>
#include <csignal>  // for kill, sigprocmask
#include <format>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <string_view>
#include <system_error>
#include <tuple>
#include <vector>

extern char **environ;

namespace curlew {

namespace asio = boost::asio;

// Closes the descriptor unless ownership was released
struct fd_guard {
  int fd{-1};
  fd_guard() = default;
  explicit fd_guard(const int fd) : fd{fd} {}
  fd_guard(const fd_guard &) = delete;
  auto
  operator=(const fd_guard &) -> fd_guard & = delete;
  ~fd_guard() { reset(); }
  auto
  release() noexcept -> int {
    const int tmp = fd;
    fd = -1;
    return tmp;
  }
  auto
  reset() noexcept -> void {
    if (fd >= 0)
      ::close(fd);
    fd = -1;
  }
};

[[nodiscard]] static auto
make_pipe(fd_guard &read_end, fd_guard &write_end) -> std::error_code {
  std::array<int, 2> fds{};
  if (pipe2(fds.data(), O_CLOEXEC) != 0)
    return std::make_error_code(std::errc(errno));
  read_end.fd = fds[0];
  write_end.fd = fds[1];
  return {};
}

/// The parent environment with the given variables replaced or added
[[nodiscard]] static auto
make_environment(const std::vector<std::tuple<std::string, std::string>> &env)
  -> std::vector<std::string> {
  const auto is_overridden = [&](const std::string_view entry) {
    const auto name = entry.substr(0, entry.find('='));
    for (const auto &[k, v] : env)
      if (k == name)
        return true;
    return false;
  };
  std::vector<std::string> r;
  for (auto e = environ; e && *e; ++e)
    if (!is_overridden(*e))
      r.emplace_back(*e);
  for (const auto &[k, v] : env)
    r.emplace_back(std::format("{}={}", k, v));
  return r;
}

[[nodiscard]] static auto
as_c_strings(std::vector<std::string> &v) -> std::vector<char *> {
  std::vector<char *> r;
  r.reserve(std::size(v) + 1);
  for (auto &s : v)
    r.push_back(s.data());
  r.push_back(nullptr);
  return r;
}

[[nodiscard]] static auto
decode_wait_status(const int status) noexcept -> int {
  if (WIFEXITED(status))
    return WEXITSTATUS(status);
  if (WIFSIGNALED(status))
    return 128 + WTERMSIG(status);
  return status;
}

struct invocation_runner::invocation {
  asio::io_context ioc;
  asio::posix::stream_descriptor out{ioc};
  asio::posix::stream_descriptor err{ioc};
  asio::steady_timer wait_timer{ioc};
  asio::steady_timer kill_timer{ioc};
  asio::steady_timer drain_timer{ioc};
  std::array<char, read_buf_size> out_buf{};
  std::array<char, read_buf_size> err_buf{};
  const stderr_consumer *on_stderr{};
  std::chrono::milliseconds kill_grace{};
  invocation_result result;
  pid_t pid{-1};
  bool exited{};
  bool out_open{true};
  bool err_open{true};

  invocation() = default;
  invocation(const invocation &) = delete;
  auto
  operator=(const invocation &) -> invocation & = delete;

  // a child still running here was abandoned by an exception
  ~invocation() {
    if (pid > 0 && !exited) {
      ::kill(pid, SIGKILL);
      int status{};
      while (waitpid(pid, &status, 0) < 0 && errno == EINTR)
        ;
    }
  }

  auto
  read_out() -> void {
    out.async_read_some(
      asio::buffer(out_buf),
      [this](const boost::system::error_code ec, const std::size_t n) {
        if (n > 0)
          result.stdout_data.append(out_buf.data(), n);
        if (ec) {
          out_open = false;
          pipe_closed(out);
          return;
        }
        read_out();
      });
  }

  auto
  read_err() -> void {
    err.async_read_some(
      asio::buffer(err_buf),
      [this](const boost::system::error_code ec, const std::size_t n) {
        if (n > 0) {
          const std::string_view chunk(err_buf.data(), n);
          // nothing is reported after a cancellation
          if (*on_stderr && !result.was_cancelled)
            (*on_stderr)(chunk);
          result.stderr_data.append(chunk);
        }
        if (ec) {
          err_open = false;
          pipe_closed(err);
          return;
        }
        read_err();
      });
  }

  auto
  pipe_closed(asio::posix::stream_descriptor &d) -> void {
    boost::system::error_code ignored_error;
    d.close(ignored_error);
    if (!out_open && !err_open)
      drain_timer.cancel();
  }

  auto
  poll_exit() -> void {
    wait_timer.expires_after(wait_poll_interval);
    wait_timer.async_wait([this](const boost::system::error_code ec) {
      if (ec)
        return;
      int status{};
      const auto r = waitpid(pid, &status, WNOHANG);
      if (r == pid) {
        child_exited(decode_wait_status(status));
        return;
      }
      if (r < 0 && errno != EINTR) {
        // the child can no longer be waited for
        logger::instance().debug("Error waiting for pid {}: {}", pid,
                                 std::make_error_code(std::errc(errno)));
        child_exited(-1);
        return;
      }
      poll_exit();
    });
  }

  auto
  child_exited(const int exit_code) -> void {
    exited = true;
    result.exit_code = exit_code;
    kill_timer.cancel();
    logger::instance().debug("Process {} exited with status {}", pid,
                             exit_code);
    if (!out_open && !err_open)
      return;
    // descendants of the tool might keep the pipes open
    drain_timer.expires_after(drain_timeout);
    drain_timer.async_wait([this](const boost::system::error_code ec) {
      if (ec)
        return;
      boost::system::error_code ignored_error;
      out.close(ignored_error);
      err.close(ignored_error);
    });
  }

  auto
  terminate() -> void {
    if (exited || result.was_cancelled)
      return;
    result.was_cancelled = true;
    logger::instance().debug("Terminating process {}", pid);
    ::kill(pid, SIGTERM);
    kill_timer.expires_after(kill_grace);
    kill_timer.async_wait([this](const boost::system::error_code ec) {
      if (ec || exited)
        return;
      logger::instance().debug("Killing process {}", pid);
      ::kill(pid, SIGKILL);
    });
  }
};

auto
invocation_runner::cancel() noexcept -> void {
  std::shared_ptr<invocation> inv;
  {
    std::lock_guard lck{mtx};
    if (!running)
      return;
    // seen by run() if the child is not yet started
    cancel_requested = true;
    inv = active;
  }
  if (!inv)
    return;
  post_terminate(*inv);
}

auto
invocation_runner::post_terminate(invocation &inv) -> void {
  // handlers are never run after the invocation is destroyed, so a raw
  // pointer is safe and avoids a reference cycle through the io_context
  asio::post(inv.ioc, [raw = &inv] { raw->terminate(); });
}

[[nodiscard]] auto
invocation_runner::cancel_was_requested() -> bool {
  std::lock_guard lck{mtx};
  return cancel_requested;
}

[[nodiscard]] auto
invocation_runner::is_running() const -> bool {
  std::lock_guard lck{mtx};
  return running;
}

[[nodiscard]] auto
invocation_runner::run(
  const std::vector<std::string> &args,
  const std::vector<std::tuple<std::string, std::string>> &env,
  const stderr_consumer &on_stderr, std::stop_token stop_token,
  std::error_code &error) -> invocation_result {
  auto &lgr = logger::instance();

  {
    std::lock_guard lck{mtx};
    running = true;
    cancel_requested = false;
  }
  struct run_guard {
    invocation_runner &runner;
    ~run_guard() {
      std::lock_guard lck{runner.mtx};
      runner.running = false;
      runner.active.reset();
    }
  } const guard{*this};

  if (stop_token.stop_requested()) {
    // cancelled before the tool was started
    invocation_result r;
    r.was_cancelled = true;
    return r;
  }

  const auto path = find_path_to_binary(tool, error);
  if (error) {
    lgr.debug("Failed to find {}: {}", tool, error);
    return {};
  }

  std::vector<std::string> argv_strs{tool};
  argv_strs.insert(std::cend(argv_strs), std::cbegin(args), std::cend(args));
  auto env_strs = make_environment(env);
  const auto argv = as_c_strings(argv_strs);
  const auto envp = as_c_strings(env_strs);

  fd_guard dev_null(::open("/dev/null", O_RDONLY | O_CLOEXEC));
  if (dev_null.fd < 0) {
    error = std::make_error_code(std::errc(errno));
    return {};
  }
  fd_guard out_r, out_w, err_r, err_w, status_r, status_w;
  if ((error = make_pipe(out_r, out_w)))
    return {};
  if ((error = make_pipe(err_r, err_w)))
    return {};
  // reports a failed exec
  if ((error = make_pipe(status_r, status_w)))
    return {};

  auto inv = std::make_shared<invocation>();
  inv->on_stderr = &on_stderr;
  inv->kill_grace = kill_grace;

  if (stop_token.stop_requested() || cancel_was_requested()) {
    lgr.debug("Cancelled before starting {}", path);
    invocation_result r;
    r.was_cancelled = true;
    return r;
  }

  inv->ioc.notify_fork(asio::io_context::fork_prepare);
  const pid_t pid = fork();
  if (pid == 0) {
    // child: only async-signal-safe calls from here
    sigset_t mask;
    sigemptyset(&mask);
    sigprocmask(SIG_SETMASK, &mask, nullptr);
    // own process group: terminal interrupts are for the parent to handle
    setpgid(0, 0);
    if (dup2(dev_null.fd, STDIN_FILENO) < 0 ||
        dup2(out_w.fd, STDOUT_FILENO) < 0 ||
        dup2(err_w.fd, STDERR_FILENO) < 0) {
      const int e = errno;
      [[maybe_unused]] const auto n = ::write(status_w.fd, &e, sizeof(e));
      _exit(127);
    }
    execve(path.c_str(), argv.data(), envp.data());
    const int e = errno;
    [[maybe_unused]] const auto n = ::write(status_w.fd, &e, sizeof(e));
    _exit(127);
  }
  inv->ioc.notify_fork(asio::io_context::fork_parent);
  if (pid < 0) {
    error = std::make_error_code(std::errc(errno));
    lgr.debug("Failed to fork: {}", error);
    return {};
  }
  inv->pid = pid;

  // the child's ends
  dev_null.reset();
  out_w.reset();
  err_w.reset();
  status_w.reset();

  int child_errno{};
  ssize_t n_read{};
  do {
    n_read = ::read(status_r.fd, &child_errno, sizeof(child_errno));
  } while (n_read < 0 && errno == EINTR);
  if (n_read == static_cast<ssize_t>(sizeof(child_errno))) {
    // nothing was started, just reap the child
    int status{};
    while (waitpid(pid, &status, 0) < 0 && errno == EINTR)
      ;
    inv->exited = true;
    error = std::make_error_code(std::errc(child_errno));
    lgr.debug("Failed to execute {}: {}", path, error);
    return {};
  }
  status_r.reset();
  lgr.debug("Started {} (pid {})", path, pid);

  inv->out.assign(out_r.release());
  inv->err.assign(err_r.release());
  bool cancel_pending{};
  {
    std::lock_guard lck{mtx};
    active = inv;
    cancel_pending = cancel_requested;
  }
  // a cancel that arrived while the child was starting
  if (cancel_pending)
    post_terminate(*inv);
  std::stop_callback on_stop(stop_token, [this] { cancel(); });

  inv->read_out();
  inv->read_err();
  inv->poll_exit();
  inv->ioc.run();

  return std::move(inv->result);
}

}  // namespace curlew
