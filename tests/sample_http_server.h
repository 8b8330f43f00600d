#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/write.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <google/protobuf/util/json_util.h>

#include "tether/sample.pb.h"

namespace tether::testing {

/// In-process HTTP(S) server implementing the sample greeting model:
///   POST /api/v1/<model>/Predict           {"model_id", "inputs": {...}}
///   POST /api/v1/<model>/PredictStreamIn   {"model_id", "inputs": [...]}
///   POST /api/v1/<model>/PredictStreamOut  server-sent events
/// The name "error" yields 400, "slow" delays the reply, "fail-after-3"
/// breaks the event stream and "endless" streams until the client leaves.
class SampleHttpServer {
public:
    explicit SampleHttpServer(std::shared_ptr<boost::asio::ssl::context> tls = nullptr)
        : tls_(std::move(tls)),
          acceptor_(ioc_, boost::asio::ip::tcp::endpoint(
                              boost::asio::ip::make_address("127.0.0.1"), 0)) {
        port_ = acceptor_.local_endpoint().port();
        accept_thread_ = std::thread([this] { AcceptLoop(); });
    }

    ~SampleHttpServer() {
        Stop();
    }

    SampleHttpServer(const SampleHttpServer&) = delete;
    SampleHttpServer& operator=(const SampleHttpServer&) = delete;

    // Server TLS context; |client_ca_pem| non-empty requires client certificates.
    static std::shared_ptr<boost::asio::ssl::context> MakeTlsContext(
        const std::string& cert_pem, const std::string& key_pem,
        const std::string& client_ca_pem = "") {
        namespace ssl = boost::asio::ssl;
        auto ctx = std::make_shared<ssl::context>(ssl::context::tls_server);
        ctx->use_certificate_chain(boost::asio::buffer(cert_pem));
        ctx->use_private_key(boost::asio::buffer(key_pem), ssl::context::pem);
        if (!client_ca_pem.empty()) {
            ctx->add_certificate_authority(boost::asio::buffer(client_ca_pem));
            ctx->set_verify_mode(ssl::verify_peer | ssl::verify_fail_if_no_peer_cert);
        }
        return ctx;
    }

    int GetPort() const {
        return port_;
    }

    std::string GetLastModelId() {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_model_id_;
    }

    std::string GetLastTarget() {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_target_;
    }

    int GetActiveStreams() const {
        return active_streams_.load();
    }

    int GetRequestCount() const {
        return request_count_.load();
    }

    void Stop() {
        if (!running_.exchange(false)) {
            return;
        }
        // Wake the blocking accept.
        boost::system::error_code ec;
        boost::asio::io_context wake_ioc;
        boost::asio::ip::tcp::socket wake(wake_ioc);
        wake.connect(boost::asio::ip::tcp::endpoint(
                         boost::asio::ip::make_address("127.0.0.1"), port_),
                     ec);
        if (accept_thread_.joinable()) {
            accept_thread_.join();
        }
        std::vector<std::thread> sessions;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            sessions.swap(sessions_);
        }
        for (auto& session : sessions) {
            session.join();
        }
    }

private:
    void AcceptLoop() {
        while (running_) {
            boost::system::error_code ec;
            boost::asio::ip::tcp::socket socket(ioc_);
            acceptor_.accept(socket, ec);
            if (!running_) {
                break;
            }
            if (ec) {
                continue;
            }
            std::lock_guard<std::mutex> lock(mutex_);
            sessions_.emplace_back(
                [this, s = std::move(socket)]() mutable { HandleSession(std::move(s)); });
        }
    }

    void HandleSession(boost::asio::ip::tcp::socket socket) {
        namespace beast = boost::beast;
        beast::error_code ec;
        if (tls_) {
            beast::ssl_stream<boost::asio::ip::tcp::socket> stream(std::move(socket), *tls_);
            stream.handshake(boost::asio::ssl::stream_base::server, ec);
            if (ec) {
                return;
            }
            Serve(stream);
            stream.shutdown(ec);
        } else {
            Serve(socket);
            socket.shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
        }
    }

    template <class Stream>
    void Serve(Stream& stream) {
        namespace beast = boost::beast;
        namespace http = beast::http;

        beast::flat_buffer buffer;
        http::request<http::string_body> request;
        beast::error_code ec;
        http::read(stream, buffer, request, ec);
        if (ec) {
            return;
        }
        ++request_count_;

        const std::string target(request.target().data(), request.target().size());
        {
            std::lock_guard<std::mutex> lock(mutex_);
            last_target_ = target;
        }

        google::protobuf::util::JsonParseOptions options;
        options.ignore_unknown_fields = true;

        if (EndsWith(target, "/PredictStreamIn")) {
            sample::HttpBatchRequest batch;
            if (!google::protobuf::util::JsonStringToMessage(request.body(), &batch, options).ok()) {
                WriteJson(stream, http::status::bad_request, R"({"details":"malformed batch"})");
                return;
            }
            RecordModelId(batch.model_id());
            std::string joined;
            for (int i = 0; i < batch.inputs_size(); ++i) {
                if (i > 0) {
                    joined += ",";
                }
                joined += batch.inputs(i).name();
            }
            WriteJson(stream, http::status::ok, Greeting("Hello " + joined));
            return;
        }

        sample::HttpUnaryRequest unary;
        if (!google::protobuf::util::JsonStringToMessage(request.body(), &unary, options).ok()) {
            WriteJson(stream, http::status::bad_request, R"({"details":"malformed request"})");
            return;
        }
        RecordModelId(unary.model_id());
        const std::string& name = unary.inputs().name();

        if (EndsWith(target, "/PredictStreamOut")) {
            StreamGreetings(stream, name);
        } else if (EndsWith(target, "/Predict")) {
            if (name == "error") {
                WriteJson(stream, http::status::bad_request, R"({"details":"name rejected"})");
                return;
            }
            if (name == "slow") {
                std::this_thread::sleep_for(std::chrono::milliseconds(1500));
            }
            WriteJson(stream, http::status::ok, Greeting("Hello " + name));
        } else {
            WriteJson(stream, http::status::not_found, R"({"details":"no such route"})");
        }
    }

    template <class Stream>
    void StreamGreetings(Stream& stream, const std::string& name) {
        namespace beast = boost::beast;
        namespace http = beast::http;

        ++active_streams_;
        beast::error_code ec;
        http::response<http::empty_body> response{http::status::ok, 11};
        response.set(http::field::content_type, "text/event-stream");
        response.keep_alive(false);
        response.chunked(true);
        http::response_serializer<http::empty_body> serializer{response};
        http::write_header(stream, serializer, ec);

        auto send_event = [&](const std::string& event) {
            if (!ec) {
                boost::asio::write(stream, http::make_chunk(boost::asio::buffer(event)), ec);
            }
            return !ec;
        };

        if (name == "endless") {
            while (running_ && send_event("data: " + Greeting("Hello endless stream") + "\n\n")) {
                std::this_thread::sleep_for(std::chrono::milliseconds(10));
            }
        } else if (name == "fail-after-3") {
            for (int i = 0; i < 3; ++i) {
                send_event("data: " + Greeting("Hello " + name + " stream") + "\n\n");
            }
            send_event("event: error\ndata: {\"details\":\"stream broke\"}\n\n");
        } else {
            for (int i = 0; i < 10; ++i) {
                send_event("data: " + Greeting("Hello " + name + " stream") + "\n\n");
            }
        }
        if (!ec) {
            boost::asio::write(stream, http::make_chunk_last(), ec);
        }
        --active_streams_;
    }

    template <class Stream>
    static void WriteJson(Stream& stream, boost::beast::http::status status,
                          const std::string& body) {
        namespace http = boost::beast::http;
        http::response<http::string_body> response{status, 11};
        response.set(http::field::content_type, "application/json");
        response.keep_alive(false);
        response.body() = body;
        response.prepare_payload();
        boost::beast::error_code ec;
        http::write(stream, response, ec);
    }

    static std::string Greeting(const std::string& text) {
        sample::SampleOutput output;
        output.set_greeting(text);
        std::string json;
        if (!google::protobuf::util::MessageToJsonString(output, &json).ok()) {
            return "{}";
        }
        return json;
    }

    static bool EndsWith(const std::string& text, const std::string& suffix) {
        return text.size() >= suffix.size() &&
               text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
    }

    void RecordModelId(const std::string& model_id) {
        std::lock_guard<std::mutex> lock(mutex_);
        last_model_id_ = model_id;
    }

    std::shared_ptr<boost::asio::ssl::context> tls_;
    boost::asio::io_context ioc_;
    boost::asio::ip::tcp::acceptor acceptor_;
    int port_ = 0;
    std::atomic<bool> running_{true};
    std::thread accept_thread_;

    std::mutex mutex_;
    std::vector<std::thread> sessions_;
    std::string last_model_id_;
    std::string last_target_;
    std::atomic<int> active_streams_{0};
    std::atomic<int> request_count_{0};
};

}  // namespace tether::testing
