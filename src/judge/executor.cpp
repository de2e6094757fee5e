#include "judge/executor.hpp"
#include <fcntl.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <poll.h>
#include <signal.h>
#include <sys/resource.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <time.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <system_error>
#include <vector>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"

namespace grader {
using namespace std;

const struct timespec killdelay = {0, 100000000L};  // 0.1s

const int BUF_SIZE = 4096;

// 每次 poll 最多等待的时间，以便及时发现子进程退出
const int POLL_INTERVAL_MS = 50;

const int PIPE_READ = 0;
const int PIPE_WRITE = 1;

template <typename... Args>
[[noreturn]] static void error(int err, fmt::format_string<Args...> format, Args &&... args) {
    throw system_error(err, system_category(), fmt::format(format, std::forward<Args>(args)...));
}

static void close_fd(int &fd) {
    if (fd >= 0) close(fd);
    fd = -1;
}

static void make_pipe(int fds[2]) {
    if (pipe2(fds, O_CLOEXEC) != 0)
        error(errno, "unable to create pipe");
}

static int decode_status(int status) {
    if (WIFEXITED(status))
        return WEXITSTATUS(status);
    else if (WIFSIGNALED(status))
        return -WTERMSIG(status);
    else
        return -1;
}

/**
 * @brief 先尝试 SIGTERM，再 SIGKILL 杀死整个进程组
 */
static void terminate_group(pid_t pid) {
    LOG(INFO) << "sending SIGTERM to process group " << pid;
    if (kill(-pid, SIGTERM) != 0 && errno != ESRCH)
        LOG(WARNING) << "unable to send SIGTERM to process group " << pid << ": " << strerror(errno);

    nanosleep(&killdelay, nullptr);

    LOG(INFO) << "sending SIGKILL to process group " << pid;
    if (kill(-pid, SIGKILL) != 0 && errno != ESRCH)
        LOG(WARNING) << "unable to send SIGKILL to process group " << pid << ": " << strerror(errno);
}

/**
 * @brief 从管道读取一次数据
 * @param buffer 读取到的数据，超出 limit 时丢弃最早的部分，
 * 评测程序的结果行总在最后，因此必须保留尾部
 * @return 若管道已经关闭则返回 false
 */
static bool pump_pipe(int fd, string &buffer, size_t limit) {
    char buf[BUF_SIZE];
    ssize_t nread = read(fd, buf, BUF_SIZE);
    if (nread > 0) {
        buffer.append(buf, nread);
        // 攒到两倍再截断，避免每次读取都移动整个缓冲区
        if (buffer.size() > 2 * limit)
            buffer.erase(0, buffer.size() - limit);
        return true;
    } else if (nread == 0) {
        return false;
    } else if (errno == EINTR || errno == EAGAIN) {
        return true;
    } else {
        error(errno, "unable to read from pipe");
    }
}

process_executor::process_executor(const sandbox_config &config, launch_spec spec)
    : config(config), spec(move(spec)) {}

run_result process_executor::run(const string &source, chrono::duration<double> timeout) const {
    try {
        return run_impl(source, timeout);
    } catch (const std::exception &e) {
        LOG(ERROR) << "Unable to run " << spec.interpreter << ": " << e.what();
        return launch_failure{e.what()};
    }
}

run_result process_executor::run_impl(const string &source, chrono::duration<double> timeout) const {
    scoped_temp_file file(config.temp_dir, spec.suffix);
    file.write(source);

    // exec 之后子进程只能调用 async-signal-safe 的函数，因此参数和环境变量都要在 fork 之前准备好
    map<string, string> env;
    for (auto &key : config.inherited_env)
        if (const char *value = getenv(key.c_str()))
            env[key] = value;
    for (auto &[key, value] : spec.env)
        env[key] = value;

    vector<string> env_strings;
    for (auto &[key, value] : env)
        env_strings.push_back(key + "=" + value);
    vector<char *> envp;
    for (auto &entry : env_strings)
        envp.push_back(entry.data());
    envp.push_back(nullptr);

    string interpreter = spec.interpreter;
    string script = file.path().string();
    vector<char *> argv = {interpreter.data(), script.data(), nullptr};

    int stdout_pipe[2] = {-1, -1}, stderr_pipe[2] = {-1, -1}, exec_pipe[2] = {-1, -1};
    int devnull = -1;
    defer {
        for (int *fds : {stdout_pipe, stderr_pipe, exec_pipe}) {
            close_fd(fds[PIPE_READ]);
            close_fd(fds[PIPE_WRITE]);
        }
        close_fd(devnull);
    };

    make_pipe(stdout_pipe);
    make_pipe(stderr_pipe);
    make_pipe(exec_pipe);
    devnull = open("/dev/null", O_RDONLY | O_CLOEXEC);
    if (devnull < 0)
        error(errno, "unable to open /dev/null");

    elapsed_time timer;
    pid_t pid = fork();
    if (pid < 0)
        error(errno, "unable to fork");

    if (pid == 0) {  // 子进程
        setpgid(0, 0);
        dup2(devnull, STDIN_FILENO);
        dup2(stdout_pipe[PIPE_WRITE], STDOUT_FILENO);
        dup2(stderr_pipe[PIPE_WRITE], STDERR_FILENO);

        struct rlimit no_core = {0, 0};
        setrlimit(RLIMIT_CORE, &no_core);

        execve(argv[0], argv.data(), envp.data());

        // exec 失败时将 errno 告知父进程
        int err = errno;
        ssize_t ignored = write(exec_pipe[PIPE_WRITE], &err, sizeof(err));
        (void)ignored;
        _exit(127);
    }

    // 父进程
    // 和子进程同时设置进程组，避免父进程发送信号时子进程还没有设置进程组
    setpgid(pid, pid);

    bool reaped = false;
    int status = 0;
    defer {
        if (!reaped) {
            kill(-pid, SIGKILL);
            waitpid(pid, nullptr, 0);
        }
    };

    close_fd(stdout_pipe[PIPE_WRITE]);
    close_fd(stderr_pipe[PIPE_WRITE]);
    close_fd(exec_pipe[PIPE_WRITE]);

    int exec_errno = 0;
    ssize_t nread;
    while ((nread = read(exec_pipe[PIPE_READ], &exec_errno, sizeof(exec_errno))) < 0 && errno == EINTR)
        ;
    if (nread == sizeof(exec_errno)) {
        waitpid(pid, nullptr, 0);
        reaped = true;
        throw launch_error(fmt::format("unable to execute {}: {}", spec.interpreter, strerror(exec_errno)));
    }

    process_output output;
    auto deadline = chrono::steady_clock::now() + chrono::duration_cast<chrono::steady_clock::duration>(timeout);
    bool stdout_open = true, stderr_open = true, group_killed = false, timed_out = false;

    while (true) {
        if (!reaped) {
            pid_t waited = waitpid(pid, &status, WNOHANG);
            if (waited == pid) {
                reaped = true;
            } else if (waited < 0 && errno != EINTR) {
                error(errno, "unable to wait for process {}", pid);
            }
        }

        if (reaped && !stdout_open && !stderr_open) break;

        // 进程已经退出但管道仍被它的子进程持有，杀死整个进程组以免等到超时
        if (reaped && !group_killed) {
            kill(-pid, SIGKILL);
            group_killed = true;
        }

        auto now = chrono::steady_clock::now();
        if (now >= deadline) {
            timed_out = true;
            break;
        }
        int wait_ms = min<long long>(POLL_INTERVAL_MS, chrono::duration_cast<chrono::milliseconds>(deadline - now).count() + 1);

        struct pollfd fds[2];
        nfds_t nfds = 0;
        if (stdout_open) fds[nfds++] = {stdout_pipe[PIPE_READ], POLLIN, 0};
        if (stderr_open) fds[nfds++] = {stderr_pipe[PIPE_READ], POLLIN, 0};

        int ready = poll(nfds ? fds : nullptr, nfds, wait_ms);
        if (ready < 0) {
            if (errno == EINTR) continue;
            error(errno, "unable to poll pipes");
        }

        for (nfds_t i = 0; i < nfds; ++i) {
            if (!fds[i].revents) continue;
            if (fds[i].fd == stdout_pipe[PIPE_READ])
                stdout_open = pump_pipe(fds[i].fd, output.stdout_text, config.max_capture_bytes);
            else
                stderr_open = pump_pipe(fds[i].fd, output.stderr_text, config.max_capture_bytes);
        }
    }

    output.elapsed_ms = timer.milliseconds();

    if (timed_out) {
        LOG(WARNING) << "Process " << pid << " exceeded time limit of " << timeout.count() << "s";
        terminate_group(pid);
        if (!reaped) {
            waitpid(pid, nullptr, 0);
            reaped = true;
        }
        return process_timeout{output.elapsed_ms};
    }

    output.exit_code = decode_status(status);
    for (string *text : {&output.stdout_text, &output.stderr_text})
        if (text->size() > config.max_capture_bytes)
            text->erase(0, text->size() - config.max_capture_bytes);
    output.stdout_text = utf8_sanitize(output.stdout_text);
    output.stderr_text = utf8_sanitize(output.stderr_text);
    return output;
}

}  // namespace grader
