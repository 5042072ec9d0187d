#include "server/server.hpp"
#include <glog/logging.h>
#include <fcntl.h>
#include <sys/socket.h>
#include <unistd.h>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/post.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <thread>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "judge/request.hpp"
#include "monitor/host_status.hpp"
#include "server/auth.hpp"

namespace judged::server {
using namespace std;
using namespace nlohmann;
namespace beast = boost::beast;
namespace http = boost::beast::http;
namespace asio = boost::asio;
using tcp = boost::asio::ip::tcp;

/**
 * @brief 请求体的最大长度，请求中可以直接包含测试数据
 */
static constexpr uint64_t MAX_BODY_SIZE = 256 * 1024 * 1024;

judge_server::judge_server(worker_pool &pool, spj_cache &cache, cancellation_registry &registry)
    : judge(pool, cache), registry(registry) {}

bool judge_server::is_known_method(const string &method) {
    return method == "judge" || method == "ping" || method == "compile_spj";
}

json judge_server::call(const string &method, const string &body) {
    if (method == "ping")
        return sample_host_status().to_json();

    json j;
    try {
        j = json::parse(body);
    } catch (json::parse_error &e) {
        throw invalid_request("malformed json: " + string(e.what()));
    }

    auto token = registry.create();
    defer { registry.remove(token); };

    if (method == "judge") {
        judge_request req = parse_judge_request(j);
        json results = json::array();
        for (auto &result : judge.judge(req, *token))
            results.push_back(result.to_json());
        return results;
    } else {
        compile_spj_request req = parse_compile_spj_request(j);
        judge.compile_spj(req, *token);
        return "success";
    }
}

json judge_server::handle(const string &method, const string &token, const string &body) {
    try {
        if (!is_known_method(method))
            throw invalid_request("unknown method");
        verify_token(token);
        return {{"err", nullptr}, {"data", call(method, body)}};
    } catch (internal_error &e) {
        LOG(ERROR) << "Internal error while handling " << method << ": " << e;
        return {{"err", e.error_name()}, {"data", e.what()}};
    } catch (judge_exception &e) {
        LOG(INFO) << method << " failed with " << e.error_name() << ": " << e.what();
        return {{"err", e.error_name()}, {"data", e.what()}};
    } catch (exception &e) {
        LOG(ERROR) << "Unexpected error while handling " << method << ": " << e.what();
        return {{"err", "JudgeClientError"}, {"data", e.what()}};
    }
}

string dump_response(const json &response) {
    return response.dump(-1, ' ', false, json::error_handler_t::replace);
}

/**
 * @brief 设置 FD_CLOEXEC，Asio 创建的套接字默认会被子进程继承
 */
static bool set_cloexec(int fd) {
    int flags = fcntl(fd, F_GETFD);
    if (flags < 0 || fcntl(fd, F_SETFD, flags | FD_CLOEXEC) < 0) {
        LOG(ERROR) << "Unable to set FD_CLOEXEC on socket " << fd << ": " << strerror(errno);
        return false;
    }
    return true;
}

http_server::http_server(judge_server &handler, cancellation_registry &registry, const string &address, unsigned short port)
    : handler(handler), registry(registry), ioc(1), acceptor(ioc), signals(ioc, SIGINT, SIGTERM) {
    tcp::endpoint endpoint(asio::ip::make_address(address), port);
    acceptor.open(endpoint.protocol());
    if (!set_cloexec(acceptor.native_handle()))
        throw boost::system::system_error(errno, boost::system::system_category(), "fcntl");
    acceptor.set_option(asio::socket_base::reuse_address(true));
    acceptor.bind(endpoint);
    acceptor.listen(asio::socket_base::max_listen_connections);
    LOG(INFO) << "Listening on " << address << ":" << acceptor.local_endpoint().port();
}

unsigned short http_server::port() const {
    return acceptor.local_endpoint().port();
}

void http_server::stop() {
    asio::post(ioc, [this] { shutdown(); });
}

void http_server::run() {
    signals.async_wait([this](const boost::system::error_code &ec, int signal) {
        if (ec) return;
        LOG(INFO) << "Received signal " << signal << ", shutting down";
        shutdown();
    });
    accept();
    ioc.run();

    unique_lock<mutex> lock(mut);
    sessions_done.wait(lock, [this] { return active_sessions == 0; });
    LOG(INFO) << "All sessions finished";
}

void http_server::shutdown() {
    registry.cancel_all();
    boost::system::error_code ec;
    acceptor.close(ec);
    if (ec) LOG(WARNING) << "Unable to close acceptor: " << ec.message();
    signals.cancel(ec);

    // 唤醒阻塞在读取请求上的连接，包括空闲的 keep-alive 连接
    lock_guard<mutex> guard(mut);
    stopping = true;
    for (int fd : session_fds)
        if (::shutdown(fd, SHUT_RDWR) != 0 && errno != ENOTCONN)
            LOG(WARNING) << "Unable to shut down connection " << fd << ": " << strerror(errno);
}

bool http_server::register_session(int fd) {
    lock_guard<mutex> guard(mut);
    if (stopping) return false;
    session_fds.insert(fd);
    return true;
}

void http_server::unregister_session(int fd) {
    lock_guard<mutex> guard(mut);
    session_fds.erase(fd);
}

void http_server::accept() {
    acceptor.async_accept([this](const boost::system::error_code &ec, tcp::socket socket) {
        if (ec) {
            if (ec != asio::error::operation_aborted)
                LOG(ERROR) << "Unable to accept connection: " << ec.message();
            if (!acceptor.is_open()) return;
        } else {
            // 连接交给独立的线程及其自己的 io_context，与 acceptor 的 io_context 无关
            tcp socket_protocol = acceptor.local_endpoint().protocol();
            boost::system::error_code release_ec;
            int fd = socket.release(release_ec);
            if (release_ec) {
                LOG(ERROR) << "Unable to release connection: " << release_ec.message();
            } else if (!set_cloexec(fd)) {
                ::close(fd);
            } else {
                {
                    lock_guard<mutex> guard(mut);
                    ++active_sessions;
                }
                thread(&http_server::session, this, fd, socket_protocol).detach();
            }
        }
        accept();
    });
}

/**
 * @brief 由路径得到调用名称，比如 "/judge?x=1" 得到 "judge"
 */
static string method_of(beast::string_view target) {
    target = target.substr(0, target.find('?'));
    string path(target.data(), target.size());
    while (!path.empty() && path.front() == '/') path.erase(path.begin());
    return path;
}

void http_server::session(int fd, tcp protocol) {
    defer {
        lock_guard<mutex> guard(mut);
        if (--active_sessions == 0) sessions_done.notify_all();
    };
    try {
        asio::io_context session_ioc;
        tcp::socket socket(session_ioc, protocol, fd);
        if (!register_session(fd)) return;
        // 必须在 socket 关闭之前注销，避免 shutdown 作用到被复用的文件描述符上
        defer { unregister_session(fd); };

        beast::error_code ec;
        beast::flat_buffer buffer;
        while (true) {
            http::request_parser<http::string_body> parser;
            parser.body_limit(MAX_BODY_SIZE);
            http::read(socket, buffer, parser, ec);
            if (ec == http::error::end_of_stream) break;
            if (ec) {
                LOG(WARNING) << "Unable to read request: " << ec.message();
                break;
            }

            auto &req = parser.get();
            string method = method_of(req.target());
            beast::string_view token = req["X-Judge-Server-Token"];
            json response = handler.handle(method, string(token.data(), token.size()), req.body());

            http::response<http::string_body> res{
                judge_server::is_known_method(method) ? http::status::ok : http::status::not_found,
                req.version()};
            res.set(http::field::server, "judged");
            res.set(http::field::content_type, "application/json");
            res.keep_alive(req.keep_alive());
            res.body() = dump_response(response);
            res.prepare_payload();

            http::write(socket, res, ec);
            if (ec) {
                LOG(WARNING) << "Unable to write response: " << ec.message();
                break;
            }
            if (!res.keep_alive()) break;
        }

        socket.shutdown(tcp::socket::shutdown_send, ec);
    } catch (exception &e) {
        LOG(ERROR) << "Connection failed: " << e.what();
    }
}

}  // namespace judged::server
