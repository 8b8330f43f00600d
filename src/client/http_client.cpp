#include "tether/client/http_client.h"

#include <chrono>
#include <deque>
#include <optional>
#include <utility>

#include <absl/log/log.h>
#include <absl/log/vlog_is_on.h>
#include <absl/strings/str_cat.h>
#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <google/protobuf/util/json_util.h>
#include <openssl/ssl.h>

#include "json_fields.h"
#include "tether/common/error.h"

namespace tether {

namespace {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;
using Clock = std::chrono::steady_clock;

constexpr char kJsonContentType[] = "application/json";
constexpr char kEventStreamContentType[] = "text/event-stream";
constexpr size_t kReadChunkSize = 8192;

/// One request/response exchange over its own TCP (optionally TLS)
/// connection. Every operation runs asynchronously on a private io_context
/// so the per-call deadline bounds each of them.
class HttpConnection {
public:
    HttpConnection(const ConnectionDescriptor& connection,
                   std::shared_ptr<ssl::context> ssl_context,
                   bool verify_peer,
                   std::optional<Clock::time_point> deadline)
        : host_(connection.GetHost()),
          port_(std::to_string(connection.GetPort())),
          ssl_context_(std::move(ssl_context)),
          verify_peer_(verify_peer),
          deadline_(deadline) {}

    ~HttpConnection() {
        Close();
    }

    HttpConnection(const HttpConnection&) = delete;
    HttpConnection& operator=(const HttpConnection&) = delete;

    absl::Status Connect() {
        tcp::resolver resolver(ioc_);
        tcp::resolver::results_type endpoints;
        beast::error_code ec = net::error::would_block;
        resolver.async_resolve(host_, port_,
                               [&](beast::error_code e, tcp::resolver::results_type r) {
                                   ec = e;
                                   endpoints = std::move(r);
                               });
        ioc_.restart();
        ioc_.run();
        if (ec) {
            return ConnectionError(absl::StrCat("cannot resolve ", host_, ": ", ec.message()));
        }

        if (ssl_context_) {
            tls_ = std::make_unique<beast::ssl_stream<beast::tcp_stream>>(ioc_, *ssl_context_);
            beast::error_code address_ec;
            net::ip::make_address(host_, address_ec);
            // SNI is only meaningful for host names.
            if (address_ec &&
                !SSL_set_tlsext_host_name(tls_->native_handle(), host_.c_str())) {
                return ConnectionError("failed to set TLS server name");
            }
            if (verify_peer_) {
                tls_->set_verify_callback(ssl::host_name_verification(host_));
            }
        } else {
            plain_ = std::make_unique<beast::tcp_stream>(ioc_);
        }

        ArmTimer();
        ec = Await([&](auto handler) {
            Lowest().async_connect(endpoints, std::move(handler));
        });
        if (ec) {
            return TransportError("connect", ec);
        }

        if (tls_) {
            ArmTimer();
            ec = Await([&](auto handler) {
                tls_->async_handshake(ssl::stream_base::client, std::move(handler));
            });
            if (ec) {
                return TransportError("TLS handshake", ec);
            }
        }
        return absl::OkStatus();
    }

    absl::Status Send(http::request<http::string_body>& request) {
        ArmTimer();
        auto ec = Await([&](auto handler) {
            WithStream([&](auto& stream) {
                http::async_write(stream, request, std::move(handler));
            });
        });
        if (ec) {
            return TransportError("send request", ec);
        }
        return absl::OkStatus();
    }

    absl::StatusOr<http::response<http::string_body>> ReceiveResponse(size_t body_limit) {
        http::response_parser<http::string_body> parser;
        parser.body_limit(body_limit);
        ArmTimer();
        auto ec = Await([&](auto handler) {
            WithStream([&](auto& stream) {
                http::async_read(stream, buffer_, parser, std::move(handler));
            });
        });
        if (ec) {
            return TransportError("read response", ec);
        }
        return parser.release();
    }

    template <class Parser>
    absl::Status ReceiveHeader(Parser& parser) {
        ArmTimer();
        auto ec = Await([&](auto handler) {
            WithStream([&](auto& stream) {
                http::async_read_header(stream, buffer_, parser, std::move(handler));
            });
        });
        if (ec) {
            return TransportError("read response header", ec);
        }
        return absl::OkStatus();
    }

    template <class Parser>
    absl::Status ReceiveSome(Parser& parser) {
        ArmTimer();
        auto ec = Await([&](auto handler) {
            WithStream([&](auto& stream) {
                http::async_read_some(stream, buffer_, parser, std::move(handler));
            });
        });
        if (ec && ec != http::error::need_buffer) {
            return TransportError("read response body", ec);
        }
        return absl::OkStatus();
    }

    void Close() {
        if (closed_) {
            return;
        }
        closed_ = true;
        if (!plain_ && !tls_) {
            return;
        }
        beast::error_code ec;
        Lowest().socket().shutdown(tcp::socket::shutdown_both, ec);
        Lowest().close();
    }

private:
    template <class Op>
    beast::error_code Await(Op&& op) {
        beast::error_code result = net::error::would_block;
        std::forward<Op>(op)([&result](beast::error_code ec, auto&&...) { result = ec; });
        ioc_.restart();
        ioc_.run();
        return result;
    }

    template <class F>
    void WithStream(F&& f) {
        if (tls_) {
            f(*tls_);
        } else {
            f(*plain_);
        }
    }

    beast::tcp_stream& Lowest() {
        return tls_ ? beast::get_lowest_layer(*tls_) : *plain_;
    }

    void ArmTimer() {
        if (deadline_) {
            Lowest().expires_at(*deadline_);
        } else {
            Lowest().expires_never();
        }
    }

    absl::Status TransportError(const char* phase, const beast::error_code& ec) const {
        if (ec == beast::error::timeout) {
            return TimeoutError(absl::StrCat(phase, " to ", host_, ":", port_, " timed out"));
        }
        return ConnectionError(absl::StrCat(phase, " to ", host_, ":", port_,
                                            " failed: ", ec.message()));
    }

    std::string host_;
    std::string port_;
    std::shared_ptr<ssl::context> ssl_context_;
    bool verify_peer_;
    std::optional<Clock::time_point> deadline_;

    net::io_context ioc_;
    std::unique_ptr<beast::tcp_stream> plain_;
    std::unique_ptr<beast::ssl_stream<beast::tcp_stream>> tls_;
    beast::flat_buffer buffer_;
    bool closed_ = false;
};

absl::Status ErrorFromResponse(int status, beast::string_view reason, const std::string& body) {
    std::string message;
    if (auto details = internal::ExtractJsonStringField(body, "details")) {
        message = *details;
    } else if (!body.empty() && body.size() <= 512) {
        message = body;
    } else {
        message.assign(reason.data(), reason.size());
    }
    return HttpRemoteError(status, message, body);
}

bool IsSuccess(int status) {
    return status >= 200 && status < 300;
}

/// Incremental decoder for server-sent events. Handles events split across
/// reads. Without an event-stream content type every non-empty line is a
/// JSON document of its own.
class EventDecoder {
public:
    struct Event {
        std::string type;
        std::string data;
    };

    explicit EventDecoder(bool server_sent_events)
        : sse_(server_sent_events) {}

    void Append(const char* data, size_t size) {
        for (size_t i = 0; i < size; ++i) {
            if (data[i] != '\r') {
                pending_.push_back(data[i]);
            }
        }
        const char* separator = sse_ ? "\n\n" : "\n";
        const size_t separator_size = sse_ ? 2 : 1;
        size_t pos;
        while ((pos = pending_.find(separator)) != std::string::npos) {
            std::string block = pending_.substr(0, pos);
            pending_.erase(0, pos + separator_size);
            AddBlock(block);
        }
    }

    // End of body: whatever is left forms the last event.
    void Flush() {
        if (!pending_.empty()) {
            std::string block;
            block.swap(pending_);
            AddBlock(block);
        }
    }

    bool Empty() const {
        return events_.empty();
    }

    Event Pop() {
        Event event = std::move(events_.front());
        events_.pop_front();
        return event;
    }

private:
    void AddBlock(const std::string& block) {
        if (!sse_) {
            if (block.find_first_not_of(" \t") != std::string::npos) {
                events_.push_back(Event{"", block});
            }
            return;
        }

        Event event;
        bool has_data = false;
        size_t start = 0;
        while (start <= block.size()) {
            size_t end = block.find('\n', start);
            if (end == std::string::npos) {
                end = block.size();
            }
            std::string line = block.substr(start, end - start);
            start = end + 1;

            if (line.empty() || line[0] == ':') {
                continue;
            }
            size_t colon = line.find(':');
            std::string field = line.substr(0, colon);
            std::string value;
            if (colon != std::string::npos) {
                value = line.substr(colon + 1);
                if (!value.empty() && value[0] == ' ') {
                    value.erase(0, 1);
                }
            }
            if (field == "data") {
                if (has_data) {
                    event.data.push_back('\n');
                }
                event.data += value;
                has_data = true;
            } else if (field == "event") {
                event.type = value;
            }
        }
        if (has_data) {
            events_.push_back(std::move(event));
        }
    }

    bool sse_;
    std::string pending_;
    std::deque<Event> events_;
};

/// Stream-out response body, decoded one event at a time as it arrives.
class HttpOutputStream final : public OutputStreamBase {
public:
    using Parser = http::response_parser<http::buffer_body>;

    HttpOutputStream(std::unique_ptr<HttpConnection> connection,
                     std::unique_ptr<Parser> parser,
                     std::string route,
                     const google::protobuf::Descriptor* output_type,
                     bool server_sent_events)
        : connection_(std::move(connection)),
          parser_(std::move(parser)),
          route_(std::move(route)),
          output_type_(output_type),
          decoder_(server_sent_events),
          chunk_(kReadChunkSize) {}

    ~HttpOutputStream() override {
        Cancel();
    }

protected:
    absl::StatusOr<std::unique_ptr<google::protobuf::Message>> Pull() override {
        while (decoder_.Empty()) {
            if (parser_->is_done()) {
                decoder_.Flush();
                if (decoder_.Empty()) {
                    LOG(INFO) << "[HTTP] <-- " << route_ << " stream closed";
                    return std::unique_ptr<google::protobuf::Message>();
                }
                break;
            }

            auto& body = parser_->get().body();
            body.data = chunk_.data();
            body.size = chunk_.size();
            auto status = connection_->ReceiveSome(*parser_);
            if (!status.ok()) {
                LOG(WARNING) << "[HTTP] <-- " << route_ << " stream failed: " << status.message();
                return status;
            }
            decoder_.Append(chunk_.data(), chunk_.size() - body.size);
        }

        EventDecoder::Event event = decoder_.Pop();
        if (event.type == "error") {
            auto details = internal::ExtractJsonStringField(event.data, "details");
            return RemoteError(absl::StatusCode::kInternal,
                               details ? *details : event.data);
        }
        VLOG(1) << "[HTTP] <-- " << route_ << " event: " << event.data;
        return DecodeJsonMessage(event.data, output_type_);
    }

    void Release() override {
        if (!parser_->is_done()) {
            LOG(INFO) << "[HTTP] " << route_ << " stream abandoned after "
                      << GetDeliveredCount() << " message(s)";
        }
        connection_->Close();
    }

private:
    std::unique_ptr<HttpConnection> connection_;
    std::unique_ptr<Parser> parser_;
    std::string route_;
    const google::protobuf::Descriptor* output_type_;
    EventDecoder decoder_;
    std::vector<char> chunk_;
};

absl::StatusOr<std::string> EncodeJsonMessage(const google::protobuf::Message& message) {
    google::protobuf::util::JsonPrintOptions options;
    options.preserve_proto_field_names = true;
    std::string json;
    auto status = google::protobuf::util::MessageToJsonString(message, &json, options);
    if (!status.ok()) {
        return ConfigurationError(absl::StrCat("cannot encode ", message.GetTypeName(),
                                               " as JSON: ", status.ToString()));
    }
    return json;
}

}  // namespace

absl::StatusOr<std::unique_ptr<google::protobuf::Message>> DecodeJsonMessage(
    const std::string& json,
    const google::protobuf::Descriptor* type) {
    auto message = NewMessage(type);
    if (!message) {
        return absl::InternalError("no message factory for response type");
    }
    google::protobuf::util::JsonParseOptions options;
    options.ignore_unknown_fields = true;
    auto status = google::protobuf::util::JsonStringToMessage(json, message.get(), options);
    if (!status.ok()) {
        return RemoteError(absl::StatusCode::kInternal,
                           absl::StrCat("malformed ", type->full_name(),
                                        " from server: ", status.ToString()));
    }
    return message;
}

HTTPClient::HTTPClient(ConnectionDescriptor connection,
                       std::shared_ptr<boost::asio::ssl::context> ssl_context,
                       bool verify_peer,
                       ClientOptions options)
    : connection_(std::move(connection)),
      ssl_context_(std::move(ssl_context)),
      verify_peer_(verify_peer),
      options_(std::move(options)) {}

HTTPClient::~HTTPClient() = default;

absl::StatusOr<std::unique_ptr<HTTPClient>> HTTPClient::Create(
    const ConnectionDescriptor& connection,
    const ResolvedCredentials& credentials,
    const ClientOptions& options) {

    if (credentials.tls && !credentials.ssl_context) {
        return ConfigurationError("TLS is enabled but no SSL context was resolved");
    }

    LOG(INFO) << "[HTTP] Client for " << connection.GetTarget()
              << (credentials.tls ? (credentials.mutual ? " (mTLS)" : " (TLS)") : " (plaintext)");
    return std::make_unique<HTTPClient>(connection, credentials.ssl_context,
                                        credentials.verify_peer, options);
}

Protocol HTTPClient::GetProtocol() const {
    return Protocol::kHttp;
}

absl::StatusOr<std::string> HTTPClient::EncodeRequest(
    const google::protobuf::Message& input) const {
    auto json = EncodeJsonMessage(input);
    if (!json.ok()) {
        return json.status();
    }
    return absl::StrCat("{\"model_id\":\"", internal::JsonEscape(options_.target_id),
                        "\",\"inputs\":", *json, "}");
}

absl::StatusOr<std::string> HTTPClient::EncodeBatchRequest(InputStream& inputs) const {
    std::string body = absl::StrCat("{\"model_id\":\"", internal::JsonEscape(options_.target_id),
                                    "\",\"inputs\":[");
    size_t count = 0;
    while (const google::protobuf::Message* item = inputs.Next()) {
        auto json = EncodeJsonMessage(*item);
        if (!json.ok()) {
            return json.status();
        }
        if (count > 0) {
            body.push_back(',');
        }
        body += *json;
        ++count;
        if (body.size() > options_.max_batch_bytes) {
            return WithErrorKind(
                absl::ResourceExhaustedError(absl::StrCat(
                    "stream-in batch exceeds ", options_.max_batch_bytes,
                    " bytes after ", count, " input(s)")),
                ErrorKind::kConfiguration);
        }
    }
    if (!inputs.GetStatus().ok()) {
        return inputs.GetStatus();
    }
    body += "]}";
    return body;
}

absl::StatusOr<std::unique_ptr<google::protobuf::Message>> HTTPClient::Exchange(
    const OperationShape& shape,
    std::string body) {

    std::optional<Clock::time_point> deadline;
    if (options_.timeout) {
        deadline = Clock::now() + *options_.timeout;
    }

    HttpConnection connection(connection_, ssl_context_, verify_peer_, deadline);
    auto status = connection.Connect();
    if (!status.ok()) {
        LOG(WARNING) << "[HTTP] " << shape.http_route << ": " << status.message();
        return status;
    }

    http::request<http::string_body> request{http::verb::post, shape.http_route, 11};
    request.set(http::field::host, connection_.GetTarget());
    request.set(http::field::user_agent, options_.user_agent);
    request.set(http::field::content_type, kJsonContentType);
    request.set(http::field::accept, kJsonContentType);
    request.keep_alive(false);
    request.body() = std::move(body);
    request.prepare_payload();

    LOG(INFO) << "[HTTP] --> POST " << shape.http_route;
    VLOG(1) << "[HTTP] --> Content: " << request.body();

    status = connection.Send(request);
    if (!status.ok()) {
        return status;
    }
    auto response = connection.ReceiveResponse(options_.max_message_size);
    if (!response.ok()) {
        LOG(WARNING) << "[HTTP] " << shape.http_route << ": " << response.status().message();
        return response.status();
    }

    const int code = response->result_int();
    if (!IsSuccess(code)) {
        LOG(WARNING) << "[HTTP] <-- " << code << " from " << shape.http_route;
        return ErrorFromResponse(code, response->reason(), response->body());
    }
    VLOG(1) << "[HTTP] <-- Content: " << response->body();
    return DecodeJsonMessage(response->body(), shape.output_type);
}

absl::StatusOr<std::unique_ptr<google::protobuf::Message>> HTTPClient::CallUnary(
    const OperationShape& shape,
    const google::protobuf::Message& input) {
    auto body = EncodeRequest(input);
    if (!body.ok()) {
        return body.status();
    }
    return Exchange(shape, std::move(*body));
}

absl::StatusOr<std::unique_ptr<google::protobuf::Message>> HTTPClient::CallStreamIn(
    const OperationShape& shape,
    InputStream& inputs) {
    auto body = EncodeBatchRequest(inputs);
    if (!body.ok()) {
        return body.status();
    }
    return Exchange(shape, std::move(*body));
}

absl::StatusOr<std::unique_ptr<OutputStream>> HTTPClient::CallStreamOut(
    const OperationShape& shape,
    const google::protobuf::Message& input) {

    auto body = EncodeRequest(input);
    if (!body.ok()) {
        return body.status();
    }

    std::optional<Clock::time_point> deadline;
    if (options_.timeout) {
        deadline = Clock::now() + *options_.timeout;
    }

    auto connection = std::make_unique<HttpConnection>(connection_, ssl_context_,
                                                       verify_peer_, deadline);
    auto status = connection->Connect();
    if (!status.ok()) {
        LOG(WARNING) << "[HTTP] " << shape.http_route << ": " << status.message();
        return status;
    }

    http::request<http::string_body> request{http::verb::post, shape.http_route, 11};
    request.set(http::field::host, connection_.GetTarget());
    request.set(http::field::user_agent, options_.user_agent);
    request.set(http::field::content_type, kJsonContentType);
    request.set(http::field::accept, kEventStreamContentType);
    request.keep_alive(false);
    request.body() = std::move(*body);
    request.prepare_payload();

    LOG(INFO) << "[HTTP] --> POST " << shape.http_route << " (server stream)";
    VLOG(1) << "[HTTP] --> Content: " << request.body();

    status = connection->Send(request);
    if (!status.ok()) {
        return status;
    }

    auto parser = std::make_unique<HttpOutputStream::Parser>();
    parser->body_limit(boost::none);
    status = connection->ReceiveHeader(*parser);
    if (!status.ok()) {
        LOG(WARNING) << "[HTTP] " << shape.http_route << ": " << status.message();
        return status;
    }

    const int code = parser->get().result_int();
    if (!IsSuccess(code)) {
        // Collect the (bounded) error body before reporting.
        std::string error_body;
        std::vector<char> chunk(kReadChunkSize);
        while (!parser->is_done() && error_body.size() < options_.max_message_size) {
            auto& buffer = parser->get().body();
            buffer.data = chunk.data();
            buffer.size = chunk.size();
            if (!connection->ReceiveSome(*parser).ok()) {
                break;
            }
            error_body.append(chunk.data(), chunk.size() - buffer.size);
        }
        LOG(WARNING) << "[HTTP] <-- " << code << " from " << shape.http_route;
        return ErrorFromResponse(code, parser->get().reason(), error_body);
    }

    auto content_type = parser->get()[http::field::content_type];
    const bool sse = content_type.starts_with(kEventStreamContentType);
    return std::unique_ptr<OutputStream>(std::make_unique<HttpOutputStream>(
        std::move(connection), std::move(parser), shape.http_route, shape.output_type, sse));
}

}  // namespace tether
