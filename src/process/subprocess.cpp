#include "process/subprocess.hpp"
#include <errno.h>
#include <fcntl.h>
#include <glog/logging.h>
#include <poll.h>
#include <signal.h>
#include <string.h>
#include <sys/resource.h>
#include <sys/syscall.h>
#include <sys/wait.h>
#include <unistd.h>
#include <algorithm>
#include <mutex>
#include <system_error>
#include <vector>

extern char **environ;

namespace sandbox::process {
using namespace std;

static const size_t BUF_SIZE = 64 * 1024;

// 没有 pidfd 时轮询子进程状态的间隔
static const chrono::milliseconds EXIT_POLL_INTERVAL(10);

/**
 * @brief 子进程在 exec 之前出错时通过管道发给父进程的信息
 */
struct child_error {
    int stage;
    int error;
};

enum child_stage {
    STAGE_REDIRECT = 1,
    STAGE_RLIMIT = 2,
    STAGE_CHDIR = 3,
    STAGE_EXEC = 4
};

static const char *describe_stage(int stage) {
    switch (stage) {
        case STAGE_REDIRECT: return "redirecting standard streams";
        case STAGE_RLIMIT: return "setting memory limit";
        case STAGE_CHDIR: return "changing working directory";
        case STAGE_EXEC: return "executing /bin/bash";
        default: return "preparing child process";
    }
}

/**
 * @brief 子进程向父进程报告 exec 之前的错误并退出
 */
[[noreturn]] static void child_fail(int fd, int stage) {
    child_error err = {stage, errno};
    ssize_t ignored = write(fd, &err, sizeof(err));
    (void)ignored;
    _exit(127);
}

const chrono::hours MAX_TIMEOUT(24);

clock_type::time_point deadline_after(chrono::duration<double> timeout) {
    chrono::duration<double> bounded = timeout;
    if (!(bounded.count() > 0)) bounded = chrono::duration<double>::zero();
    if (bounded > MAX_TIMEOUT) bounded = MAX_TIMEOUT;
    return clock_type::now() + chrono::duration_cast<clock_type::duration>(bounded);
}

void ignore_sigpipe() {
    static once_flag flag;
    call_once(flag, [] {
        struct sigaction sigact;
        memset(&sigact, 0, sizeof(sigact));
        sigact.sa_handler = SIG_IGN;
        sigemptyset(&sigact.sa_mask);
        if (sigaction(SIGPIPE, &sigact, nullptr) != 0)
            PLOG(ERROR) << "unable to ignore SIGPIPE";
    });
}

static int open_pidfd(pid_t pid) {
#ifdef SYS_pidfd_open
    int fd = (int)syscall(SYS_pidfd_open, pid, 0);
    if (fd >= 0) return fd;
#endif
    (void)pid;
    return -1;
}

static int decode_wait_status(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    if (WIFSTOPPED(status)) return 128 + WSTOPSIG(status);
    return -1;
}

subprocess::subprocess(const spawn_options &options, process_tree_reaper &reaper)
    : reaper(reaper) {
    spawn(options);
}

subprocess::~subprocess() {
    if (child_pid <= 0 || has_reaped) return;
    terminate();
    int status;
    while (waitpid(child_pid, &status, 0) < 0) {
        if (errno != EINTR) {
            PLOG(ERROR) << "waiting on child " << child_pid;
            break;
        }
    }
}

void subprocess::spawn(const spawn_options &options) {
    ignore_sigpipe();

    // fork 之后子进程只能调用异步信号安全的函数，参数和环境变量都要提前准备好
    string shell = "/bin/bash";
    vector<string> args = {shell, "-c", options.command};
    vector<char *> argv;
    for (auto &arg : args) argv.push_back(arg.data());
    argv.push_back(nullptr);

    map<string, string> env_map;
    for (char **e = environ; e && *e; ++e) {
        string entry(*e);
        auto eq = entry.find('=');
        if (eq == string::npos) continue;
        env_map[entry.substr(0, eq)] = entry.substr(eq + 1);
    }
    for (auto &[key, value] : options.env) env_map[key] = value;
    vector<string> envs;
    for (auto &[key, value] : env_map) envs.push_back(key + "=" + value);
    vector<char *> envp;
    for (auto &entry : envs) envp.push_back(entry.data());
    envp.push_back(nullptr);

    string workdir = options.workdir.string();
    bool limit_memory = options.memory_limit.has_value();
    struct rlimit memory_rlimit;
    if (limit_memory) {
        memory_rlimit.rlim_cur = memory_rlimit.rlim_max = (rlim_t)*options.memory_limit;
    }

    file_descriptor child_stdin;
    file_descriptor parent_stdin;
    if (options.pipe_stdin) {
        auto [read_end, write_end] = make_pipe();
        child_stdin = move(read_end);
        parent_stdin = move(write_end);
    } else {
        int fd = open("/dev/null", O_RDONLY | O_CLOEXEC);
        if (fd < 0) throw system_error(errno, system_category(), "opening /dev/null");
        child_stdin = file_descriptor(fd);
    }
    auto [stdout_read, stdout_write] = make_pipe();
    auto [stderr_read, stderr_write] = make_pipe();
    auto [error_read, error_write] = make_pipe();

    pid_t pid = fork();
    switch (pid) {
        case -1:
            throw system_error(errno, system_category(), "unable to fork");
        case 0: {  // 子进程，只调用异步信号安全的函数
            // 成为新会话的首进程，整棵进程树共享同一个会话号和进程组号
            setsid();

            sigset_t emptymask;
            sigemptyset(&emptymask);
            sigprocmask(SIG_SETMASK, &emptymask, nullptr);
            signal(SIGPIPE, SIG_DFL);

            if (dup2(child_stdin.get(), STDIN_FILENO) < 0 ||
                dup2(stdout_write.get(), STDOUT_FILENO) < 0 ||
                dup2(stderr_write.get(), STDERR_FILENO) < 0)
                child_fail(error_write.get(), STAGE_REDIRECT);

            if (limit_memory) {
                if (setrlimit(RLIMIT_AS, &memory_rlimit) != 0 ||
                    setrlimit(RLIMIT_DATA, &memory_rlimit) != 0)
                    child_fail(error_write.get(), STAGE_RLIMIT);
            }

            if (!workdir.empty() && chdir(workdir.c_str()) != 0)
                child_fail(error_write.get(), STAGE_CHDIR);

            execve(argv[0], argv.data(), envp.data());
            child_fail(error_write.get(), STAGE_EXEC);
        } break;
        default:
            break;
    }

    child_pid = pid;
    // 关闭父进程中属于子进程的一端，否则读端永远等不到 EOF
    child_stdin.close();
    stdout_write.close();
    stderr_write.close();
    error_write.close();

    child_error err;
    ssize_t nread;
    do {
        nread = read(error_read.get(), &err, sizeof(err));
    } while (nread < 0 && errno == EINTR);
    if (nread == (ssize_t)sizeof(err)) {
        // exec 之前出错，子进程已经 _exit，回收后报告启动失败
        int status;
        while (waitpid(child_pid, &status, 0) < 0 && errno == EINTR) {}
        has_exited = has_reaped = true;
        throw system_error(err.error, system_category(), describe_stage(err.stage));
    }

    pidfd = file_descriptor(open_pidfd(child_pid));
    if (parent_stdin.valid()) stdin_pipe = make_unique<pipe_writer>(move(parent_stdin));
    stdout_pipe = move(stdout_read);
    stderr_pipe = move(stderr_read);
    set_nonblocking(stdout_pipe.get());
    set_nonblocking(stderr_pipe.get());

    VLOG(1) << "spawned child " << child_pid << ": " << options.command;
}

pid_t subprocess::pid() const {
    return child_pid;
}

writable_stream *subprocess::input() {
    return stdin_pipe.get();
}

bool subprocess::check_exited() {
    if (has_exited) return true;
    siginfo_t info;
    memset(&info, 0, sizeof(info));
    if (waitid(P_PID, child_pid, &info, WEXITED | WNOHANG | WNOWAIT) == 0) {
        if (info.si_pid == child_pid) has_exited = true;
    } else if (errno == ECHILD) {
        // 子进程已经被别处回收，无法再得到返回码
        LOG(WARNING) << "child " << child_pid << " was reaped elsewhere";
        has_exited = has_reaped = true;
    } else if (errno != EINTR) {
        throw system_error(errno, system_category(), "checking state of child");
    }
    return has_exited;
}

bool subprocess::exited() {
    return check_exited();
}

bool subprocess::outputs_closed() const {
    return !stdout_pipe.valid() && !stderr_pipe.valid();
}

string &subprocess::stdout_data() {
    return stdout_buffer;
}

string &subprocess::stderr_data() {
    return stderr_buffer;
}

void subprocess::read_available(file_descriptor &fd, string &buffer) {
    char buf[BUF_SIZE];
    while (fd.valid()) {
        ssize_t nread = read(fd.get(), buf, BUF_SIZE);
        if (nread > 0) {
            buffer.append(buf, nread);
        } else if (nread == 0) {
            // EOF，所有写端都已经关闭
            fd.close();
        } else {
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) return;
            throw system_error(errno, system_category(), "reading output of child");
        }
    }
}

bool subprocess::pump(clock_type::time_point deadline, stdin_feeder *feeder) {
    auto now = clock_type::now();
    if (now >= deadline) return false;
    check_exited();

    vector<struct pollfd> fds;
    int stdout_idx = -1, stderr_idx = -1, stdin_idx = -1, pidfd_idx = -1;
    if (stdout_pipe.valid()) {
        stdout_idx = fds.size();
        fds.push_back({stdout_pipe.get(), POLLIN, 0});
    }
    if (stderr_pipe.valid()) {
        stderr_idx = fds.size();
        fds.push_back({stderr_pipe.get(), POLLIN, 0});
    }
    if (feeder && !feeder->finished() && stdin_pipe && !stdin_pipe->closed()) {
        stdin_idx = fds.size();
        fds.push_back({stdin_pipe->fd(), POLLOUT, 0});
    }
    if (pidfd.valid() && !has_exited) {
        pidfd_idx = fds.size();
        fds.push_back({pidfd.get(), POLLIN, 0});
    }

    auto remaining = chrono::duration_cast<chrono::milliseconds>(deadline - now) + chrono::milliseconds(1);
    if (!pidfd.valid() && !has_exited) remaining = min(remaining, EXIT_POLL_INTERVAL);
    int timeout = (int)min<chrono::milliseconds::rep>(remaining.count(), 60 * 60 * 1000);

    int r = poll(fds.data(), fds.size(), timeout);
    if (r < 0) {
        if (errno == EINTR) return true;
        throw system_error(errno, system_category(), "waiting for child data");
    }
    if (r == 0) {
        check_exited();
        return clock_type::now() < deadline;
    }

    if (stdout_idx >= 0 && fds[stdout_idx].revents)
        read_available(stdout_pipe, stdout_buffer);
    if (stderr_idx >= 0 && fds[stderr_idx].revents)
        read_available(stderr_pipe, stderr_buffer);
    if (stdin_idx >= 0 && fds[stdin_idx].revents) {
        if (fds[stdin_idx].revents & (POLLERR | POLLHUP | POLLNVAL))
            feeder->abandon();
        else
            feeder->on_writable();
    }
    if (pidfd_idx >= 0 && fds[pidfd_idx].revents)
        check_exited();
    return true;
}

void subprocess::drain() {
    read_available(stdout_pipe, stdout_buffer);
    read_available(stderr_pipe, stderr_buffer);
}

void subprocess::terminate() {
    if (child_pid <= 0 || has_reaped) return;
    reaper.terminate(child_pid);
}

void subprocess::wait_exit_event(clock_type::time_point deadline) {
    auto remaining = chrono::duration_cast<chrono::milliseconds>(deadline - clock_type::now());
    if (remaining.count() <= 0) return;
    if (pidfd.valid()) {
        struct pollfd pfd = {pidfd.get(), POLLIN, 0};
        if (poll(&pfd, 1, (int)remaining.count() + 1) < 0 && errno != EINTR)
            throw system_error(errno, system_category(), "waiting for child exit");
    } else {
        usleep(chrono::duration_cast<chrono::microseconds>(min(remaining, EXIT_POLL_INTERVAL)).count());
    }
}

bool subprocess::reap(clock_type::time_point deadline) {
    if (has_reaped) return true;
    while (!check_exited()) {
        if (clock_type::now() >= deadline) return false;
        wait_exit_event(deadline);
    }
    if (has_reaped) return true;

    int status;
    pid_t pid;
    do {
        pid = waitpid(child_pid, &status, 0);
    } while (pid < 0 && errno == EINTR);
    if (pid < 0)
        throw system_error(errno, system_category(), "waiting on child");
    has_reaped = true;
    exitcode = decode_wait_status(status);
    return true;
}

bool subprocess::reaped() const {
    return has_reaped;
}

optional<int> subprocess::return_code() const {
    return exitcode;
}

}  // namespace sandbox::process
