#pragma once

#include "runguard_options.hpp"

/**
 * @brief 根据传入的设置运行指定的程序，并将运行结果写入 meta 文件
 * @note 该函数必须在 main 函数最后调用，或者 fork 出一个新进程再调用本函数
 * 1. 注册 SIGCHLD 来监听子进程的信号
 * 2. 创建 cgroup，并注册 cpuacct、memory、cpuset 资源管控器
 * 3. 分离 FD、FS、IPC、NET、NS、UTS、SYSVSEM 等命名空间，子进程无法访问网络
 * 4. 调用 fork 创建子进程
 *    1. 父进程（watchdog）通过 itimer 限制时钟时间，收到 SIGALRM 或 SIGTERM 时杀死整个进程组，
 *       并通过管道把子进程的 stdout、stderr 写入文件，超过 stream_size 的部分丢弃但计数
 *    2. 子进程重定向输入输出，设置 rlimit、cgroup、chroot、工作路径、用户和组，
 *       最后加载 seccomp 过滤器并执行命令
 * 5. 根据子进程的退出状态区分信号终止和正常退出，SIGXCPU 记为 CPU 时间超限，
 *    配置了系统调用规则时 SIGSYS 记为系统调用受限
 * 6. 读取 cgroup 的 CPU 时间、内存峰值、OOM 情况，杀死 cgroup 内的所有进程并删除 cgroup
 *
 * meta 文件的每一行为 "key: value"，包括：
 * memory-bytes, memory-result(oom/exceeded), exitcode, signal, wall-time, user-time,
 * sys-time, cpu-time, cpu-time-result, wall-time-result(soft-timelimit/hard-timelimit),
 * syscall-result(restricted), output-truncated, stdin-bytes, stdout-bytes, stderr-bytes,
 * 以及 runguard 自身出错时的 internal-error
 *
 * @return 子进程的返回值，被信号终止时为 128 + 信号
 */
int runit(struct runguard_options opt);
