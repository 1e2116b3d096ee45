#include "internal/process.hpp"

#include "pivot/format.hpp"

extern "C" {
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>
}

#include <cerrno>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <vector>

using namespace pivot::literals;
namespace fs = std::filesystem;

namespace pivot::internal {

    namespace detail {

        struct pipe_pair {
            int read_fd{-1};
            int write_fd{-1};

            ~pipe_pair() {
                close_read();
                close_write();
            }

            void close_read() {
                if (read_fd >= 0) {
                    ::close(read_fd);
                    read_fd = -1;
                }
            }

            void close_write() {
                if (write_fd >= 0) {
                    ::close(write_fd);
                    write_fd = -1;
                }
            }
        };

        static bool open_pipe(pipe_pair& p) {
            int fds[2]{};
            if (::pipe2(fds, O_CLOEXEC) != 0) {
                return false;
            }
            p.read_fd = fds[0];
            p.write_fd = fds[1];
            return true;
        }

        static int decode_wait_status(int status) {
            if (WIFEXITED(status)) {
                return WEXITSTATUS(status);
            }
            if (WIFSIGNALED(status)) {
                return 128 + WTERMSIG(status);
            }
            return 1;
        }

    }  // namespace detail

    process_result run_process(const std::vector<std::string>& args, std::chrono::milliseconds timeout) {
        if (args.empty()) {
            throw std::invalid_argument("run_process: empty command");
        }

        // argv is built before fork; the child must not allocate
        std::vector<char*> argv{};
        argv.reserve(args.size() + 1U);
        for (const auto& arg : args) {
            argv.push_back(const_cast<char*>(arg.c_str()));
        }
        argv.push_back(nullptr);

        detail::pipe_pair out_pipe{};
        detail::pipe_pair err_pipe{};
        detail::pipe_pair exec_pipe{};
        if (!detail::open_pipe(out_pipe) || !detail::open_pipe(err_pipe) || !detail::open_pipe(exec_pipe)) {
            throw std::runtime_error("pipe2 failed: {}"_format(std::generic_category().message(errno)));
        }

        auto started = std::chrono::steady_clock::now();
        auto pid = ::fork();
        if (pid < 0) {
            throw std::runtime_error("fork failed: {}"_format(std::generic_category().message(errno)));
        }

        if (pid == 0) {
            ::setpgid(0, 0);
            if (::dup2(out_pipe.write_fd, STDOUT_FILENO) < 0 || ::dup2(err_pipe.write_fd, STDERR_FILENO) < 0) {
                _exit(127);
            }
            ::execvp(argv[0], argv.data());
            int err = errno;
            auto written = ::write(exec_pipe.write_fd, &err, sizeof(err));
            static_cast<void>(written);
            _exit(127);
        }

        ::setpgid(pid, pid);
        out_pipe.close_write();
        err_pipe.close_write();
        exec_pipe.close_write();

        process_result result{};

        // exec_pipe closes on successful exec (CLOEXEC) or carries errno on failure
        {
            int child_errno = 0;
            ssize_t n = 0;
            do {
                n = ::read(exec_pipe.read_fd, &child_errno, sizeof(child_errno));
            } while (n < 0 && errno == EINTR);
            if (n == static_cast<ssize_t>(sizeof(child_errno))) {
                result.spawn_failed = true;
                result.stderr_text = "failed to execute {}: {}"_format(
                        args.front(), std::generic_category().message(child_errno));
            }
        }

        pollfd fds[2]{};
        fds[0] = {.fd = out_pipe.read_fd, .events = POLLIN, .revents = 0};
        fds[1] = {.fd = err_pipe.read_fd, .events = POLLIN, .revents = 0};
        int fds_open = 2;

        auto deadline = started + timeout;

        while (fds_open > 0 && !result.spawn_failed) {
            auto remaining =
                    std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now())
                            .count();
            if (remaining <= 0) {
                result.timed_out = true;
                break;
            }

            int ret = ::poll(fds, 2, static_cast<int>(remaining));
            if (ret < 0) {
                if (errno == EINTR) {
                    continue;
                }
                break;
            }
            if (ret == 0) {
                result.timed_out = true;
                break;
            }

            char chunk[4096]{};
            for (int i = 0; i < 2; ++i) {
                if (fds[i].fd < 0) {
                    continue;
                }
                if ((fds[i].revents & (POLLIN | POLLHUP | POLLERR)) != 0) {
                    auto n = ::read(fds[i].fd, chunk, sizeof(chunk));
                    if (n > 0) {
                        (i == 0 ? result.stdout_text : result.stderr_text).append(chunk, static_cast<size_t>(n));
                    }
                    else if (n == 0 || errno != EINTR) {
                        fds[i].fd = -1;
                        --fds_open;
                    }
                }
            }
        }

        if (result.timed_out) {
            ::kill(-pid, SIGKILL);
        }

        // the child may close its output and keep running, so the deadline still applies here
        int status = 0;
        for (;;) {
            auto reaped = ::waitpid(pid, &status, result.timed_out ? 0 : WNOHANG);
            if (reaped == pid) {
                break;
            }
            if (reaped < 0) {
                if (errno == EINTR) {
                    continue;
                }
                throw std::runtime_error("waitpid failed: {}"_format(std::generic_category().message(errno)));
            }
            if (std::chrono::steady_clock::now() >= deadline) {
                result.timed_out = true;
                ::kill(-pid, SIGKILL);
                continue;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds{1});
        }
        result.elapsed = std::chrono::steady_clock::now() - started;

        if (result.timed_out) {
            result.exit_code = 124;
            result.stderr_text.append("process timed out after {} ms\n"_format(timeout.count()));
        }
        else {
            result.exit_code = result.spawn_failed ? 127 : detail::decode_wait_status(status);
        }

        return result;
    }

    std::string first_line(std::string_view text) {
        auto line = text.substr(0U, text.find('\n'));
        return std::string{utils::trim_view(line)};
    }

    void make_executable(const std::string& path) {
        std::error_code ec{};
        fs::permissions(
                path,
                fs::perms::owner_exec | fs::perms::group_exec | fs::perms::others_exec,
                fs::perm_options::add,
                ec);
        if (ec) {
            throw std::runtime_error("failed to mark executable: {}"_format(path));
        }
    }

}  // namespace pivot::internal
