#include "common/utils.hpp"
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
#include <cerrno>
#include <system_error>
using namespace std;

int exec_program(const map<string, string> &env, const char **argv, const function<void(pid_t)> &on_spawn) {
    // 使用 POSIX 提供的函数来实现外部程序调用
    pid_t pid;
    switch (pid = fork()) {
        case -1:  // fork 失败
            throw system_error(errno, system_category(), "fork");
        case 0:  // 子进程
            // 避免子进程被终止，要求父进程处理中断信号
            signal(SIGINT, SIG_IGN);
            // 子进程不继承评测服务端的监听端口和 HTTP 连接
            if (close_range(3, ~0U, 0) != 0) {
                long max_fd = sysconf(_SC_OPEN_MAX);
                for (long fd = 3; fd < max_fd; ++fd) close((int)fd);
            }
            for (auto &[key, value] : env)
                set_env(key, value);
            execvp(argv[0], (char **)argv);
            _exit(EXIT_FAILURE);
        default:  // 父进程
            if (on_spawn) on_spawn(pid);

            int status;
            while (waitpid(pid, &status, 0) < 0) {
                if (errno != EINTR)
                    throw system_error(errno, system_category(), "waitpid");
            }
            if (WIFEXITED(status))
                return WEXITSTATUS(status);
            else
                return -1;
    }
}

string get_env(const string &key, const string &def_value) {
    char *result = getenv(key.c_str());
    return !result ? def_value : string(result);
}

void set_env(const string &key, const string &value, bool replace) {
    setenv(key.c_str(), value.c_str(), replace);
}

elapsed_time::elapsed_time() {
    start = chrono::steady_clock::now();
}
