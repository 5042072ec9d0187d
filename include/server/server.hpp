#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/signal_set.hpp>
#include <condition_variable>
#include <mutex>
#include <set>
#include <nlohmann/json.hpp>
#include <string>
#include "judge/cancellation.hpp"
#include "judge/judger.hpp"

/**
 * 评测服务的 HTTP 接口
 * 提供 POST /judge、POST /ping 和 POST /compile_spj 三个调用，请求头
 * X-Judge-Server-Token 必须是令牌的 sha256 摘要。
 * 响应总是 HTTP 200，内容为 {"err": null 或错误名称, "data": 结果或错误信息}，
 * 只有未知的路径返回 HTTP 404。
 */
namespace judged::server {

/**
 * @brief 处理三个调用，与传输层无关
 */
struct judge_server {
    judge_server(worker_pool &pool, spj_cache &cache, cancellation_registry &registry);

    /**
     * @brief 处理一次调用
     * 先检查令牌，令牌不正确时不会解析请求，也不会创建任何文件或进程
     * @param method 调用名称，judge、ping 或 compile_spj
     * @param token 请求头 X-Judge-Server-Token 的值
     * @param body 请求体
     * @return 响应体 {"err": ..., "data": ...}
     */
    nlohmann::json handle(const std::string &method, const std::string &token, const std::string &body);

    static bool is_known_method(const std::string &method);

private:
    nlohmann::json call(const std::string &method, const std::string &body);

    judger judge;
    cancellation_registry &registry;
};

/**
 * @brief 将响应体序列化，选手程序的输出可能不是合法的 UTF-8
 */
std::string dump_response(const nlohmann::json &response);

/**
 * @brief 基于 Boost.Beast 的 HTTP 服务
 * 在调用 run 的线程上接受连接，每个连接由一个独立的线程处理。
 * 收到 SIGINT 或 SIGTERM 后停止接受连接，取消所有正在进行的评测，
 * 关闭所有连接（包括空闲的 keep-alive 连接），等待连接的线程退出后 run 返回。
 */
struct http_server {
    http_server(judge_server &handler, cancellation_registry &registry, const std::string &address, unsigned short port);

    void run();

    /**
     * @brief 停止服务，效果与收到 SIGTERM 相同，可以在任意线程调用
     */
    void stop();

    /**
     * @brief 实际监听的端口，构造时端口为 0 则由系统分配
     */
    unsigned short port() const;

private:
    void accept();
    void session(int fd, boost::asio::ip::tcp protocol);
    void shutdown();
    bool register_session(int fd);
    void unregister_session(int fd);

    judge_server &handler;
    cancellation_registry &registry;
    boost::asio::io_context ioc;
    boost::asio::ip::tcp::acceptor acceptor;
    boost::asio::signal_set signals;

    std::mutex mut;
    std::condition_variable sessions_done;
    size_t active_sessions = 0;

    /**
     * @brief 正在处理的连接，退出时关闭它们以唤醒阻塞的读取
     */
    std::set<int> session_fds;
    bool stopping = false;
};

}  // namespace judged::server
