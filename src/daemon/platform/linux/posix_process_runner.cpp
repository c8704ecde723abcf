#include "platform/linux/posix_process_runner.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <format>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace {

Error exec_error(const char* what) {
    return Error{ErrorKind::ProcessExecution,
        std::format("Failed to execute sidecar process: {}() failed: {}", what, std::strerror(errno))};
}

void close_pair(int fds[2]) {
    if (fds[0] >= 0) ::close(fds[0]);
    if (fds[1] >= 0) ::close(fds[1]);
}

} // namespace

std::expected<ProcessOutput, Error>
PosixProcessRunner::run(const std::filesystem::path& program, const std::vector<std::string>& args) {
    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    // Reports exec failure from the child; closes on successful exec
    int exec_pipe[2] = {-1, -1};

    if (::pipe2(out_pipe, O_CLOEXEC) < 0) return std::unexpected(exec_error("pipe"));
    if (::pipe2(err_pipe, O_CLOEXEC) < 0) {
        auto err = exec_error("pipe");
        close_pair(out_pipe);
        return std::unexpected(err);
    }
    if (::pipe2(exec_pipe, O_CLOEXEC) < 0) {
        auto err = exec_error("pipe");
        close_pair(out_pipe);
        close_pair(err_pipe);
        return std::unexpected(err);
    }

    std::string program_str = program.string();
    std::vector<char*> argv;
    argv.reserve(args.size() + 2);
    argv.push_back(program_str.data());
    for (const auto& a : args) argv.push_back(const_cast<char*>(a.c_str()));
    argv.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        auto err = exec_error("fork");
        close_pair(out_pipe);
        close_pair(err_pipe);
        close_pair(exec_pipe);
        return std::unexpected(err);
    }

    if (pid == 0) {
        // Child: detach, wire stdio, exec
        ::setsid();
        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) ::dup2(devnull, STDIN_FILENO);
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::dup2(err_pipe[1], STDERR_FILENO);
        ::execv(program_str.c_str(), argv.data());
        int code = errno;
        ssize_t ignored = ::write(exec_pipe[1], &code, sizeof(code));
        (void)ignored;
        ::_exit(127);
    }

    ::close(out_pipe[1]);
    ::close(err_pipe[1]);
    ::close(exec_pipe[1]);

    ProcessOutput output;
    pollfd fds[2] = {
        {.fd = out_pipe[0], .events = POLLIN, .revents = 0},
        {.fd = err_pipe[0], .events = POLLIN, .revents = 0},
    };
    std::string* sinks[2] = {&output.stdout_text, &output.stderr_text};
    int open_streams = 2;

    while (open_streams > 0) {
        int ret = ::poll(fds, 2, -1);
        if (ret < 0) {
            if (errno == EINTR) continue;
            break;
        }
        for (int i = 0; i < 2; ++i) {
            if (fds[i].fd < 0 || fds[i].revents == 0) continue;
            char buf[4096];
            ssize_t n = ::read(fds[i].fd, buf, sizeof(buf));
            if (n > 0) {
                sinks[i]->append(buf, static_cast<size_t>(n));
            } else if (n == 0 || errno != EINTR) {
                ::close(fds[i].fd);
                fds[i].fd = -1;
                --open_streams;
            }
        }
    }
    for (auto& pfd : fds) {
        if (pfd.fd >= 0) ::close(pfd.fd);
    }

    int exec_errno = 0;
    ssize_t got = ::read(exec_pipe[0], &exec_errno, sizeof(exec_errno));
    ::close(exec_pipe[0]);

    int status;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno == EINTR) continue;
        return std::unexpected(exec_error("waitpid"));
    }

    if (got == static_cast<ssize_t>(sizeof(exec_errno))) {
        return std::unexpected(Error{ErrorKind::ProcessExecution,
            std::format("Failed to execute sidecar process {}: {}",
                        program_str, std::strerror(exec_errno))});
    }

    if (WIFEXITED(status)) {
        output.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        output.term_signal = WTERMSIG(status);
    }
    return output;
}
