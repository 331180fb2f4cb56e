#include "CommandRunner.h"
#include "Logging.h"
#include "Utils.h"
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace lan_scan {

std::chrono::milliseconds seconds_to_ms(double seconds){
    if(seconds <= 0) return std::chrono::milliseconds(0);
    return std::chrono::milliseconds(static_cast<long long>(seconds * 1000.0 + 0.5));
}

std::optional<std::string> PosixCommandRunner::find_executable(const std::string& name) const {
    return utils::find_in_path(name);
}

namespace {
void close_fd(int& fd){ if(fd >= 0){ ::close(fd); fd = -1; } }
}

CommandResult PosixCommandRunner::run(const std::vector<std::string>& argv, std::chrono::milliseconds timeout) const {
    CommandResult res;
    if(argv.empty()) return res;
    auto exe = find_executable(argv[0]);
    if(!exe){
        Logger::instance().debug("command not found: " + argv[0]);
        return res;
    }

    // Everything the child touches is prepared before fork; only
    // async-signal-safe calls happen between fork and exec.
    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for(const auto& a : argv) cargv.push_back(const_cast<char*>(a.c_str()));
    cargv.push_back(nullptr);

    int out_pipe[2] = {-1, -1}, err_pipe[2] = {-1, -1};
    if(pipe2(out_pipe, O_CLOEXEC) != 0) return res;
    if(pipe2(err_pipe, O_CLOEXEC) != 0){ close_fd(out_pipe[0]); close_fd(out_pipe[1]); return res; }

    pid_t pid = fork();
    if(pid < 0){
        Logger::instance().warn(std::string("fork() failed for ") + argv[0] + ": " + std::strerror(errno));
        close_fd(out_pipe[0]); close_fd(out_pipe[1]); close_fd(err_pipe[0]); close_fd(err_pipe[1]);
        return res;
    }
    if(pid == 0){
        int devnull = ::open("/dev/null", O_RDONLY);
        if(devnull >= 0) dup2(devnull, STDIN_FILENO);
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(err_pipe[1], STDERR_FILENO);
        execv(exe->c_str(), cargv.data());
        _exit(127); // exec failed
    }

    res.launched = true;
    close_fd(out_pipe[1]); close_fd(err_pipe[1]);
    int fds[2] = {out_pipe[0], err_pipe[0]};
    std::string* sinks[2] = {&res.out, &res.err};
    auto deadline = std::chrono::steady_clock::now() + timeout;
    char buf[8192];

    while(fds[0] >= 0 || fds[1] >= 0){
        auto now = std::chrono::steady_clock::now();
        if(now >= deadline){ res.timed_out = true; break; }
        int wait_ms = static_cast<int>(std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count());
        pollfd pfds[2]; nfds_t n = 0; int map[2] = {-1, -1};
        for(int i=0;i<2;++i){ if(fds[i] >= 0){ pfds[n].fd = fds[i]; pfds[n].events = POLLIN; pfds[n].revents = 0; map[n] = i; ++n; } }
        int rc = poll(pfds, n, wait_ms);
        if(rc < 0){
            if(errno == EINTR) continue;
            break;
        }
        for(nfds_t k=0; k<n; ++k){
            if(!(pfds[k].revents & (POLLIN | POLLHUP | POLLERR))) continue;
            int idx = map[k];
            ssize_t got = ::read(fds[idx], buf, sizeof(buf));
            if(got > 0){
                if(sinks[idx]->size() < kMaxCapture) sinks[idx]->append(buf, static_cast<size_t>(got));
            } else if(got == 0 || (errno != EINTR && errno != EAGAIN)) {
                close_fd(fds[idx]);
            }
        }
    }

    close_fd(fds[0]); close_fd(fds[1]);

    // The pipes can close before the child exits; the deadline still applies to the reap.
    int status = 0;
    pid_t w = 0;
    for(;;){
        w = waitpid(pid, &status, WNOHANG);
        if(w == pid) break;
        if(w < 0){
            if(errno == EINTR) continue;
            break;
        }
        if(res.timed_out || std::chrono::steady_clock::now() >= deadline){
            res.timed_out = true;
            kill(pid, SIGKILL);
            Logger::instance().debug("command timed out: " + argv[0]);
            do { w = waitpid(pid, &status, 0); } while(w < 0 && errno == EINTR);
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    if(w == pid && WIFEXITED(status)) res.exit_code = WEXITSTATUS(status);
    else if(w == pid && WIFSIGNALED(status)) res.exit_code = 128 + WTERMSIG(status);
    return res;
}

}
