#include "common/process.hpp"
#include <fcntl.h>
#include <glog/logging.h>
#include <poll.h>
#include <signal.h>
#include <string.h>
#include <sys/resource.h>
#include <sys/time.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <boost/algorithm/string/join.hpp>
#include <cerrno>
#include <mutex>
#include "common/exceptions.hpp"
#include "common/utils.hpp"

namespace grader {
using namespace std;

const int PIPE_IN = 1;
const int PIPE_OUT = 0;

const size_t BUF_SIZE = 4096;

// 子进程退出后，最多再花多少时间读完管道里剩下的数据
const double drain_timeout = 0.1;  // 0.1s

// 等待子进程数据或者退出的轮询间隔
const int poll_interval = 10;  // 10ms

namespace {

struct file_descriptor {
    file_descriptor() : fd(-1) {}
    explicit file_descriptor(int fd) : fd(fd) {}
    file_descriptor(file_descriptor &&other) : fd(other.fd) { other.fd = -1; }
    ~file_descriptor() { reset(); }

    file_descriptor &operator=(file_descriptor &&other) {
        swap(fd, other.fd);
        return *this;
    }

    int get() const { return fd; }
    bool valid() const { return fd >= 0; }

    void reset() {
        if (fd >= 0) close(fd);
        fd = -1;
    }

private:
    int fd;
};

/**
 * @brief 保证异常退出时子进程组被杀死并回收，避免留下僵尸进程和失控的选手程序
 */
struct child_guard {
    explicit child_guard(pid_t pid) : pid(pid) {}

    ~child_guard() {
        if (pid <= 0) return;
        // 子进程尚未被回收，进程组号仍然属于它
        if (kill(-pid, SIGKILL) != 0 && errno != ESRCH)
            LOG(ERROR) << "unable to send SIGKILL to process group " << pid << ": " << strerror(errno);
        while (waitpid(pid, nullptr, 0) < 0 && errno == EINTR) {
        }
    }

    void release() { pid = -1; }

private:
    pid_t pid;
};

/**
 * @brief 杀死子进程所在的进程组，必须在回收子进程之前调用
 */
void kill_group(pid_t pid) {
    if (kill(-pid, SIGKILL) != 0 && errno != ESRCH)
        LOG(WARNING) << "unable to kill process group " << pid << ": " << strerror(errno);
}

void make_pipe(file_descriptor &read_end, file_descriptor &write_end) {
    int fds[2];
    if (pipe2(fds, O_CLOEXEC) != 0) throw process_error(errno, "creating pipe");
    read_end = file_descriptor(fds[PIPE_OUT]);
    write_end = file_descriptor(fds[PIPE_IN]);
}

void set_nonblock(const file_descriptor &fd) {
    int flags = fcntl(fd.get(), F_GETFL);
    if (flags == -1) throw process_error(errno, "fcntl, getting flags");
    if (fcntl(fd.get(), F_SETFL, flags | O_NONBLOCK) == -1)
        throw process_error(errno, "fcntl, setting flags");
}

/**
 * @brief 向已经退出的子进程写 stdin 会收到 SIGPIPE，评测进程必须忽略它，改为处理 EPIPE
 */
void ignore_sigpipe() {
    static once_flag flag;
    call_once(flag, [] {
        struct sigaction sigact;
        memset(&sigact, 0, sizeof(sigact));
        sigact.sa_handler = SIG_IGN;
        if (sigemptyset(&sigact.sa_mask) != 0 || sigaction(SIGPIPE, &sigact, nullptr) != 0)
            LOG(WARNING) << "could not ignore SIGPIPE: " << strerror(errno);
    });
}

/**
 * @brief 读出管道中当前可读的全部数据
 * @param fd 管道读端，读到 EOF 时关闭并置为无效
 * @param buffer 保存数据
 * @param limit buffer 最多保存多少字节
 * @param truncated 若有数据因为超出 limit 被丢弃则置为真
 */
void pump_pipe(file_descriptor &fd, string &buffer, size_t limit, bool &truncated) {
    char buf[BUF_SIZE];
    while (fd.valid()) {
        ssize_t nread = read(fd.get(), buf, BUF_SIZE);
        if (nread == -1) {
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) return;
            throw process_error(errno, "reading from child pipe");
        }
        if (nread == 0) {  // EOF
            fd.reset();
            return;
        }
        size_t room = buffer.size() < limit ? limit - buffer.size() : 0;
        if ((size_t)nread > room) truncated = true;
        buffer.append(buf, min(room, (size_t)nread));
    }
}

void feed_stdin(file_descriptor &fd, const string &data, size_t &written) {
    while (fd.valid() && written < data.size()) {
        ssize_t n = write(fd.get(), data.data() + written, data.size() - written);
        if (n == -1) {
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) return;
            if (errno == EPIPE) {  // 子进程不再读取 stdin
                fd.reset();
                return;
            }
            throw process_error(errno, "writing to child stdin");
        }
        written += n;
    }
    if (written >= data.size()) fd.reset();
}

[[noreturn]] void child_fail(int report_fd, int err) {
    ssize_t ignored = write(report_fd, &err, sizeof(err));
    (void)ignored;
    _exit(127);
}

}  // namespace

process_result run_process(const process_options &opt) {
    if (opt.command.empty()) throw internal_error("empty command");
    ignore_sigpipe();

#ifndef NDEBUG
    LOG(INFO) << boost::algorithm::join(opt.command, " ");
#endif

    vector<char *> args;
    for (auto &arg : opt.command) args.push_back(const_cast<char *>(arg.c_str()));
    args.push_back(nullptr);
    string work_dir = opt.work_dir.string();

    file_descriptor stdin_read, stdin_write, stdout_read, stdout_write, stderr_read, stderr_write;
    file_descriptor exec_read, exec_write;  // exec 失败时子进程写入 errno
    make_pipe(stdin_read, stdin_write);
    make_pipe(stdout_read, stdout_write);
    make_pipe(stderr_read, stderr_write);
    make_pipe(exec_read, exec_write);

    pid_t pid = fork();
    switch (pid) {
        case -1:
            throw process_error(errno, "unable to fork");
        case 0: {  // 子进程，fork 之后只调用 async-signal-safe 的函数
            // 独立的进程组，超时时可以一次杀死选手程序产生的所有进程
            setpgid(0, 0);

            struct sigaction sigact;
            memset(&sigact, 0, sizeof(sigact));
            sigact.sa_handler = SIG_DFL;
            sigaction(SIGPIPE, &sigact, nullptr);

            if (dup2(stdin_read.get(), STDIN_FILENO) < 0 ||
                dup2(stdout_write.get(), STDOUT_FILENO) < 0 ||
                dup2(stderr_write.get(), STDERR_FILENO) < 0)
                child_fail(exec_write.get(), errno);

            if (!work_dir.empty() && chdir(work_dir.c_str()) != 0)
                child_fail(exec_write.get(), errno);

            if (opt.no_core_dumps) {
                struct rlimit lim;
                lim.rlim_cur = lim.rlim_max = 0;
                setrlimit(RLIMIT_CORE, &lim);
            }

            execvp(args[0], args.data());
            child_fail(exec_write.get(), errno);
        }
        default:
            break;
    }

    child_guard guard(pid);
    elapsed_time timer;
    // 父子进程都设置一次进程组，避免 kill(-pid) 时子进程还没来得及 setpgid
    if (setpgid(pid, pid) != 0 && errno != EACCES && errno != ESRCH)
        LOG(WARNING) << "unable to set process group of " << pid << ": " << strerror(errno);

    stdin_read.reset();
    stdout_write.reset();
    stderr_write.reset();
    exec_write.reset();

    {
        int child_errno = 0;
        ssize_t n;
        while ((n = read(exec_read.get(), &child_errno, sizeof(child_errno))) < 0 && errno == EINTR) {
        }
        if (n == (ssize_t)sizeof(child_errno))
            throw process_error(child_errno, "unable to start command " + opt.command[0]);
    }

    set_nonblock(stdin_write);
    set_nonblock(stdout_read);
    set_nonblock(stderr_read);

    process_result result;
    size_t written = 0;
    int status = 0;
    struct rusage usage;
    memset(&usage, 0, sizeof(usage));
    // 子进程已经退出但尚未被回收。僵尸进程保留了进程组号，
    // 回收之前向进程组发送信号不会误杀其他 worker 新创建的进程
    bool exited = false;
    double drain_deadline = -1;

    if (opt.stdin_data.empty()) stdin_write.reset();

    while (true) {
        if (!exited) {
            siginfo_t info;
            memset(&info, 0, sizeof(info));
            if (waitid(P_PID, pid, &info, WEXITED | WNOHANG | WNOWAIT) != 0) {
                if (errno != EINTR) throw process_error(errno, "waiting on child");
            } else if (info.si_pid == pid) {
                exited = true;
                // 选手程序可能在后台留下进程
                kill_group(pid);
                drain_deadline = timer.seconds() + drain_timeout;
            }
        }

        if (exited && !stdout_read.valid() && !stderr_read.valid()) break;

        double elapsed = timer.seconds();
        if (exited) {
            // 管道仍被逃出进程组的后台进程持有
            if (elapsed >= drain_deadline) break;
        } else if (opt.wall_limit > 0 && elapsed >= opt.wall_limit) {
            LOG(WARNING) << "timelimit exceeded (hard wall time): aborting command " << opt.command[0];
            result.timed_out = true;
            if (kill(-pid, SIGKILL) != 0)
                throw process_error(errno, "sending SIGKILL to command");
            break;
        }

        struct pollfd fds[3];
        nfds_t nfds = 0;
        if (stdin_write.valid()) fds[nfds++] = {stdin_write.get(), POLLOUT, 0};
        if (stdout_read.valid()) fds[nfds++] = {stdout_read.get(), POLLIN, 0};
        if (stderr_read.valid()) fds[nfds++] = {stderr_read.get(), POLLIN, 0};

        int timeout = poll_interval;
        if (opt.wall_limit > 0 && !exited)
            timeout = max(0, min(timeout, (int)((opt.wall_limit - elapsed) * 1000) + 1));

        int r = poll(fds, nfds, timeout);
        if (r == -1) {
            if (errno == EINTR) continue;
            throw process_error(errno, "waiting for child data");
        }

        feed_stdin(stdin_write, opt.stdin_data, written);
        pump_pipe(stdout_read, result.output, opt.stream_size, result.output_truncated);
        pump_pipe(stderr_read, result.error, opt.error_size, result.error_truncated);
    }

    // 进程组已经被杀死，回收子进程并取得资源使用统计
    pid_t reaped;
    while ((reaped = wait4(pid, &status, 0, &usage)) < 0 && errno == EINTR) {
    }
    if (reaped < 0) throw process_error(errno, "waiting on child");
    guard.release();

    result.wall_time = timer.seconds();
    result.memory = (int64_t)usage.ru_maxrss * 1024;  // ru_maxrss 单位为 KB

    if (WIFEXITED(status)) {
        result.exitcode = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        // In linux, exitcode is no larger than 127.
        result.signal = WTERMSIG(status);
        result.exitcode = result.signal + 128;
        if (!result.timed_out)
            LOG(INFO) << "Command terminated with signal (" << result.signal << ", " << strsignal(result.signal) << ")";
    }

    return result;
}

}  // namespace grader
