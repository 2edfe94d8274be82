#include "server/http_server.hpp"
#include <glog/logging.h>
#include <boost/asio/dispatch.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/version.hpp>
#include <algorithm>
#include <nlohmann/json.hpp>
#include <optional>
#include "common/exceptions.hpp"
#include "server/messages.hpp"

namespace bayview::server {
using namespace std;
namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = boost::beast::http;
using tcp = boost::asio::ip::tcp;

http_response make_json_response(const http_request &req, http::status code, const string &body) {
    http_response res{code, req.version()};
    res.set(http::field::server, "bayview-grader");
    res.set(http::field::content_type, "application/json");
    res.keep_alive(req.keep_alive());
    res.body() = body;
    res.prepare_payload();
    return res;
}

http_response make_error_response(const http_request &req, http::status code, const string &message) {
    return make_json_response(req, code, nlohmann::json{{"error", message}}.dump());
}

/**
 * @brief 一个 HTTP 连接
 * 同一时刻最多只有一个请求在评测，评测结果返回后才读取下一个请求
 */
struct http_session : public enable_shared_from_this<http_session> {
    http_session(asio::io_context &ioc, tcp::socket &&socket, concurrent_queue<message::judge_task> &task_queue)
        : ioc(ioc), stream(move(socket)), task_queue(task_queue) {}

    void run() {
        asio::dispatch(stream.get_executor(), beast::bind_front_handler(&http_session::do_read, shared_from_this()));
    }

    /**
     * @brief 关闭空闲的连接，正在评测的连接在返回结果后关闭
     */
    void shutdown() {
        closing = true;
        if (!busy) do_close();
    }

private:
    asio::io_context &ioc;
    beast::tcp_stream stream;
    beast::flat_buffer buffer;
    optional<http::request_parser<http::string_body>> parser;
    http_request req;
    shared_ptr<http_response> res;
    concurrent_queue<message::judge_task> &task_queue;
    bool busy = false, closing = false;

    void do_read() {
        if (closing) return do_close();
        parser.emplace();
        parser->body_limit(MAX_BODY_SIZE);
        http::async_read(stream, buffer, *parser, beast::bind_front_handler(&http_session::on_read, shared_from_this()));
    }

    void on_read(beast::error_code ec, size_t) {
        if (ec == http::error::end_of_stream || ec == asio::error::operation_aborted)
            return do_close();
        if (ec) {
            LOG(WARNING) << "Unable to read HTTP request: " << ec.message();
            return do_close();
        }
        req = parser->release();
        busy = true;
        handle_request();
    }

    void handle_request() {
        if (req.target() != JUDGE_SUBMISSION_TARGET)
            return send(make_error_response(req, http::status::not_found, "Unknown target " + string(req.target().data(), req.target().size())));
        if (req.method() != http::verb::post) {
            auto res = make_error_response(req, http::status::method_not_allowed, "Only POST is allowed");
            res.set(http::field::allow, "POST");
            return send(move(res));
        }

        message::judge_task task;
        try {
            task.request = parse_request(req.body());
        } catch (invalid_request &ex) {
            LOG(WARNING) << "Rejected submission request: " << ex.what();
            return send(make_error_response(req, http::status::bad_request, ex.what()));
        }

        // 评测结果在 worker 线程中返回，需要发回连接所在的线程再写入
        // 在返回评测结果之前 io_context 不能退出
        auto work = make_shared<asio::executor_work_guard<asio::io_context::executor_type>>(ioc.get_executor());
        task.callback = [self = shared_from_this(), work](const verdict &v) {
            string body = verdict_to_json(v).dump();
            asio::post(self->stream.get_executor(), [self, work, body] {
                self->send(make_json_response(self->req, http::status::ok, body));
            });
        };
        task_queue.push(move(task));
    }

    void send(http_response &&response) {
        res = make_shared<http_response>(move(response));
        http::async_write(stream, *res, beast::bind_front_handler(&http_session::on_write, shared_from_this(), res->need_eof()));
    }

    void on_write(bool close, beast::error_code ec, size_t) {
        busy = false;
        res.reset();
        if (ec) {
            LOG(WARNING) << "Unable to write HTTP response: " << ec.message();
            return do_close();
        }
        if (close || closing) return do_close();
        do_read();
    }

    void do_close() {
        beast::error_code ec;
        stream.socket().shutdown(tcp::socket::shutdown_send, ec);
        stream.socket().close(ec);
    }
};

http_server::http_server(asio::io_context &ioc, const tcp::endpoint &endpoint, concurrent_queue<message::judge_task> &task_queue)
    : ioc(ioc), acceptor(asio::make_strand(ioc)), task_queue(task_queue) {
    acceptor.open(endpoint.protocol());
    acceptor.set_option(asio::socket_base::reuse_address(true));
    acceptor.bind(endpoint);
    acceptor.listen(asio::socket_base::max_listen_connections);
}

void http_server::run() {
    LOG(INFO) << "Listening on " << acceptor.local_endpoint();
    do_accept();
}

void http_server::stop() {
    if (stopped) return;
    stopped = true;
    beast::error_code ec;
    acceptor.close(ec);
    for (auto &weak : sessions)
        if (auto session = weak.lock())
            asio::post(ioc, [session] { session->shutdown(); });
    sessions.clear();
}

unsigned short http_server::port() const {
    return acceptor.local_endpoint().port();
}

void http_server::do_accept() {
    acceptor.async_accept(asio::make_strand(ioc), beast::bind_front_handler(&http_server::on_accept, shared_from_this()));
}

void http_server::on_accept(beast::error_code ec, tcp::socket socket) {
    if (stopped) return;
    if (ec) {
        LOG(WARNING) << "Unable to accept connection: " << ec.message();
    } else {
        auto session = make_shared<http_session>(ioc, move(socket), task_queue);
        sessions.erase(remove_if(sessions.begin(), sessions.end(), [](auto &weak) { return weak.expired(); }), sessions.end());
        sessions.push_back(session);
        session->run();
    }
    do_accept();
}

}  // namespace bayview::server
