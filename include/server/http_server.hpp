#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/http.hpp>
#include <memory>
#include <string>
#include <vector>
#include "common/concurrent_queue.hpp"
#include "common/messages.hpp"

namespace bayview::server {

/**
 * @brief 评测请求的路径
 */
constexpr const char *JUDGE_SUBMISSION_TARGET = "/v1/judge-submission";

/**
 * @brief 请求体的最大长度，选手代码、输入输出都在请求体中
 */
constexpr std::size_t MAX_BODY_SIZE = 256 * 1024 * 1024;

using http_request = boost::beast::http::request<boost::beast::http::string_body>;
using http_response = boost::beast::http::response<boost::beast::http::string_body>;

/**
 * @brief 构造一个 JSON 格式的 HTTP 响应
 */
http_response make_json_response(const http_request &req, boost::beast::http::status code, const std::string &body);

/**
 * @brief 构造一个错误响应，响应体为 {"error": message}
 */
http_response make_error_response(const http_request &req, boost::beast::http::status code, const std::string &message);

struct http_session;

/**
 * @brief 评测服务的 HTTP 前端
 * 所有连接都在 io_context 所在的线程中异步处理。收到评测请求后，
 * 将评测任务推入 task_queue 交给 worker 评测，worker 评测完成后
 * 再将响应发回连接所在的线程。
 *
 * POST /v1/judge-submission: 200 和评测结果
 * 请求不合法: 400
 * 其他路径: 404
 * 其他请求方法: 405
 *
 * io_context 只能在一个线程中运行。
 */
struct http_server : public std::enable_shared_from_this<http_server> {
    /**
     * @throw boost::system::system_error 无法监听指定的地址
     */
    http_server(boost::asio::io_context &ioc, const boost::asio::ip::tcp::endpoint &endpoint,
                concurrent_queue<message::judge_task> &task_queue);

    /**
     * @brief 开始接受连接
     */
    void run();

    /**
     * @brief 停止接受新连接，并关闭空闲的连接
     * 正在评测的连接会在返回评测结果后关闭。必须在 io_context 所在的线程中调用
     */
    void stop();

    /**
     * @brief 实际监听的端口，监听 0 端口时由系统分配
     */
    unsigned short port() const;

private:
    boost::asio::io_context &ioc;
    boost::asio::ip::tcp::acceptor acceptor;
    concurrent_queue<message::judge_task> &task_queue;
    std::vector<std::weak_ptr<http_session>> sessions;
    bool stopped = false;

    void do_accept();
    void on_accept(boost::system::error_code ec, boost::asio::ip::tcp::socket socket);
};

}  // namespace bayview::server
