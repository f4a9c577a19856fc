// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "http_server.hpp"

#include <boost/algorithm/string/predicate.hpp>
#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>

#include <chrono>
#include <cstdlib>

#include <media_errors.hpp>
#include <object_key.hpp>
#include <object_store.hpp>

#include "kiln_version.hpp"
#include "multipart.hpp"

#define KILN_LOG_COMPONENT "http_server"
#include <kiln_log_macros.hpp>

namespace beast = boost::beast;
namespace http = beast::http;
namespace asio = boost::asio;
using tcp = asio::ip::tcp;

namespace kiln {
namespace server {

namespace {

constexpr const char* kServerName = "kiln/" KILN_VERSION_STRING;
constexpr const char* kStreamPrefix = "/videos/stream/";

HttpResponse text_response(int status, const std::string& body) {
  HttpResponse response;
  response.status = status;
  response.body = body;
  return response;
}

HttpResponse json_response(int status, const nlohmann::json& body) {
  HttpResponse response;
  response.status = status;
  response.content_type = "application/json";
  response.body = body.dump();
  return response;
}

int hex_value(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

// Echoed file names must not break out of a quoted header value
bool is_header_safe(const std::string& value) {
  for (char c : value) {
    if (c == '"' || c == '\\' || static_cast<unsigned char>(c) < 0x20 || c == 0x7f) {
      return false;
    }
  }
  return true;
}

http::response<http::string_body> build_response(
  const HttpResponse& resp, unsigned version, const std::string& request_id
) {
  http::response<http::string_body> response{static_cast<http::status>(resp.status), version};
  response.set(http::field::server, kServerName);
  response.set(http::field::content_type, resp.content_type);
  if (!request_id.empty()) {
    response.set("X-Request-Id", request_id);
  }
  for (const auto& header : resp.headers) {
    response.set(header.first, header.second);
  }
  response.keep_alive(false);
  response.body() = resp.body;
  response.prepare_payload();
  return response;
}

// Run the connection's pending operations, including its deadline timer
void run_until_idle(asio::io_context& io_context) {
  io_context.restart();
  io_context.run();
}

}  // namespace

std::string url_decode(const std::string& value) {
  std::string result;
  result.reserve(value.size());
  for (size_t i = 0; i < value.size(); ++i) {
    char c = value[i];
    if (c == '+') {
      result += ' ';
    } else if (c == '%' && i + 2 < value.size() && hex_value(value[i + 1]) >= 0 &&
               hex_value(value[i + 2]) >= 0) {
      result += static_cast<char>(hex_value(value[i + 1]) * 16 + hex_value(value[i + 2]));
      i += 2;
    } else {
      result += c;
    }
  }
  return result;
}

std::optional<std::string> query_param(const std::string& query, const std::string& key) {
  size_t start = 0;
  while (start <= query.size()) {
    size_t end = query.find('&', start);
    if (end == std::string::npos) {
      end = query.size();
    }
    const std::string pair = query.substr(start, end - start);
    size_t eq = pair.find('=');
    const std::string name = url_decode(pair.substr(0, eq));
    if (name == key) {
      return eq == std::string::npos ? std::string() : url_decode(pair.substr(eq + 1));
    }
    start = end + 1;
  }
  return std::nullopt;
}

// ============================================================================
// Lifecycle
// ============================================================================

HttpServer::HttpServer(const HttpServerConfig& config)
    : config_(config)
    , queue_(config.queue_capacity)
    , running_(false)
    , stop_requested_(false) {}

HttpServer::~HttpServer() {
  stop();
}

void HttpServer::register_callbacks(const Callbacks& callbacks) {
  callbacks_ = callbacks;
}

bool HttpServer::start() {
  if (running_.load()) {
    set_error_helper("Server already running");
    return false;
  }
  if (queue_.is_shutdown()) {
    set_error_helper("Server cannot be restarted after stop()");
    return false;
  }
  if (!callbacks_.upload_video || !callbacks_.upload_photo || !callbacks_.presigned_upload_url ||
      !callbacks_.open_chunk) {
    set_error_helper("Callbacks not registered. Call register_callbacks() first.");
    return false;
  }
  if (config_.workers <= 0) {
    set_error_helper("At least one worker is required");
    return false;
  }

  try {
    io_context_ = std::make_unique<asio::io_context>(1);
    acceptor_ = std::make_unique<tcp::acceptor>(*io_context_);

    tcp::endpoint endpoint{asio::ip::make_address(config_.host), config_.port};
    acceptor_->open(endpoint.protocol());
    acceptor_->set_option(asio::socket_base::reuse_address(true));
    acceptor_->bind(endpoint);
    acceptor_->listen(asio::socket_base::max_listen_connections);
  } catch (const std::exception& e) {
    set_error_helper(std::string("Failed to bind ") + get_url() + ": " + e.what());
    acceptor_.reset();
    io_context_.reset();
    return false;
  }

  try {
    stop_requested_.store(false);
    for (int i = 0; i < config_.workers; ++i) {
      workers_.emplace_back(&HttpServer::worker_loop, this, i);
    }
    accept_thread_ = std::make_unique<std::thread>(&HttpServer::accept_loop, this);
    running_.store(true);
  } catch (const std::exception& e) {
    set_error_helper(std::string("Failed to start server: ") + e.what());
    stop_requested_.store(true);
    queue_.shutdown();
    for (auto& worker : workers_) {
      worker.join();
    }
    workers_.clear();
    acceptor_.reset();
    io_context_.reset();
    return false;
  }

  KILN_LOG_INFO(
    "HTTP server listening on " << get_url() << logging::kv("workers", config_.workers)
                                << logging::kv("queue_capacity", config_.queue_capacity)
                                << logging::kv("read_timeout_sec", config_.read_timeout_sec)
  );
  return true;
}

void HttpServer::stop() {
  if (!running_.load()) {
    return;
  }

  stop_requested_.store(true);

  if (accept_thread_ && accept_thread_->joinable()) {
    accept_thread_->join();
    accept_thread_.reset();
  }

  size_t dropped = queue_.shutdown();
  if (dropped > 0) {
    KILN_LOG_WARN("Dropped queued connections on shutdown" << logging::kv("count", dropped));
  }

  for (auto& worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
  workers_.clear();

  beast::error_code ec;
  if (acceptor_) {
    acceptor_->close(ec);
  }
  acceptor_.reset();
  io_context_.reset();

  running_.store(false);
  KILN_LOG_INFO("HTTP server stopped" << logging::kv("served", requests_served_.load()));
}

bool HttpServer::is_running() const {
  return running_.load();
}

std::string HttpServer::get_url() const {
  return "http://" + config_.host + ":" + std::to_string(config_.port);
}

std::string HttpServer::get_last_error() const {
  std::lock_guard<std::mutex> lock(error_mutex_);
  return last_error_;
}

void HttpServer::set_error_helper(const std::string& error) {
  std::lock_guard<std::mutex> lock(error_mutex_);
  last_error_ = error;
}

// ============================================================================
// Connection handling
// ============================================================================

void HttpServer::accept_loop() {
  std::shared_ptr<Connection> pending;
  while (!stop_requested_.load()) {
    if (!pending) {
      pending = std::make_shared<Connection>();
      pending->io_context = std::make_unique<asio::io_context>(1);
      pending->socket = std::make_unique<tcp::socket>(*pending->io_context);
    }

    // Timed accept so stop_requested_ is checked at least once per second
    asio::steady_timer timer(*io_context_);
    timer.expires_after(std::chrono::seconds(1));

    bool accept_complete = false;
    boost::system::error_code accept_ec;

    acceptor_->async_accept(*pending->socket, [&](const boost::system::error_code& ec) {
      accept_ec = ec;
      if (!ec) {
        accept_complete = true;
        timer.cancel();
      }
    });

    timer.async_wait([&](const boost::system::error_code& ec) {
      if (ec != asio::error::operation_aborted && !accept_complete) {
        boost::system::error_code cancel_ec;
        acceptor_->cancel(cancel_ec);
      }
    });

    io_context_->restart();
    io_context_->run();

    if (stop_requested_.load()) {
      break;
    }
    if (!accept_complete) {
      if (accept_ec != asio::error::operation_aborted) {
        KILN_LOG_ERROR("Accept failed: " << accept_ec.message());
      }
      continue;
    }

    std::shared_ptr<Connection> connection = std::move(pending);
    pending.reset();

    std::string peer;
    beast::error_code ec;
    auto remote = connection->socket->remote_endpoint(ec);
    if (!ec) {
      peer = remote.address().to_string() + ":" + std::to_string(remote.port());
    }

    QueuedRequest item([this, connection]() { serve_connection(*connection); }, peer);
    if (!queue_.enqueue(std::move(item))) {
      ++requests_rejected_;
      KILN_LOG_WARN("Request queue full, rejecting connection" << logging::kv("peer", peer));
      reject_busy(*connection->socket);
    }
  }
}

void HttpServer::worker_loop(int worker_id) {
  KILN_LOG_DEBUG("Worker started" << logging::kv("worker", worker_id));
  while (!stop_requested_.load()) {
    auto item = queue_.dequeue_with_timeout(std::chrono::milliseconds(200));
    if (!item) {
      continue;
    }

    auto waited = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - item->enqueued_at
    );
    KILN_LOG_DEBUG(
      "Serving connection" << logging::kv("worker", worker_id) << logging::kv("peer", item->peer)
                           << logging::kv("queued_ms", waited.count())
    );

    try {
      item->handler();
    } catch (const std::exception& e) {
      KILN_LOG_ERROR("Connection handler failed: " << e.what());
    }
    ++requests_served_;
  }
  KILN_LOG_DEBUG("Worker stopped" << logging::kv("worker", worker_id));
}

void HttpServer::serve_connection(Connection& connection) {
  asio::io_context& io_context = *connection.io_context;
  beast::tcp_stream stream(std::move(*connection.socket));
  const auto timeout = std::chrono::seconds(config_.read_timeout_sec);

  beast::flat_buffer buffer;
  http::request_parser<http::string_body> parser;
  parser.body_limit(config_.max_body_mb * 1024 * 1024);

  beast::error_code read_ec;
  stream.expires_after(timeout);
  http::async_read(stream, buffer, parser, [&read_ec](beast::error_code ec, std::size_t) {
    read_ec = ec;
  });
  run_until_idle(io_context);

  HttpResponse response;
  unsigned version = 11;
  std::string request_id;

  if (read_ec == http::error::body_limit) {
    response =
      text_response(413, "Request body exceeds " + std::to_string(config_.max_body_mb) + " MB");
  } else if (read_ec == beast::error::timeout) {
    // tcp_stream has already closed the socket
    KILN_LOG_WARN(
      "Request not received in time, connection closed"
      << logging::kv("timeout_sec", config_.read_timeout_sec)
    );
    return;
  } else if (read_ec) {
    // Don't report on clients that simply went away
    if (read_ec != http::error::end_of_stream && read_ec != asio::error::eof &&
        read_ec != asio::error::connection_reset) {
      KILN_LOG_ERROR("Connection error: " << read_ec.message());
    }
    return;
  } else {
    auto& req = parser.get();
    HttpRequest request;
    request.method = std::string(req.method_string());
    request.target = std::string(req.target());
    request.content_type = std::string(req[http::field::content_type]);
    request.body = std::move(req.body());
    version = req.version();

    request_id = media::unique_id().substr(0, 8);
    KILN_LOG_SCOPED_CONTEXT(request_id, "http");
    try {
      response = handle_request(request);
    } catch (const std::exception& e) {
      KILN_LOG_ERROR("Request processing error: " << e.what());
      response = text_response(500, "Internal server error");
    }
    KILN_LOG_INFO(
      request.method << " " << request.target << logging::kv("status", response.status)
                     << logging::kv("bytes", response.body.size())
    );
  }

  auto message = build_response(response, version, request_id);
  beast::error_code write_ec;
  stream.expires_after(timeout);
  http::async_write(stream, message, [&write_ec](beast::error_code ec, std::size_t) {
    write_ec = ec;
  });
  run_until_idle(io_context);
  if (write_ec) {
    KILN_LOG_WARN(
      "Failed to send response" << logging::kv("status", response.status)
                                << logging::kv("error", write_ec.message())
    );
    return;
  }

  beast::error_code ec;
  stream.socket().shutdown(tcp::socket::shutdown_send, ec);
}

void HttpServer::reject_busy(tcp::socket& socket) {
  try {
    HttpResponse busy = text_response(503, "Server busy, try again later");
    busy.headers.emplace_back("Retry-After", "1");
    auto message = build_response(busy, 11, "");
    http::write(socket, message);
    beast::error_code shutdown_ec;
    socket.shutdown(tcp::socket::shutdown_send, shutdown_ec);
  } catch (const std::exception& e) {
    KILN_LOG_DEBUG("Failed to send 503: " << e.what());
  }
  // Discard whatever request bytes already arrived so close() sends FIN, not RST
  beast::error_code ec;
  socket.non_blocking(true, ec);
  char scratch[4096];
  while (!ec && socket.read_some(asio::buffer(scratch), ec) > 0) {
  }
  socket.close(ec);
}

// ============================================================================
// Routing
// ============================================================================

HttpResponse HttpServer::handle_request(const HttpRequest& request) {
  std::string path = request.target;
  std::string query;
  size_t qpos = path.find('?');
  if (qpos != std::string::npos) {
    query = path.substr(qpos + 1);
    path = path.substr(0, qpos);
  }

  KILN_LOG_DEBUG("Received request: " << request.method << " " << path);

  const bool is_get = (request.method == "GET");
  const bool is_post = (request.method == "POST");

  if (path == "/" || path == "/health") {
    return is_get ? handle_health() : text_response(405, "Method not allowed");
  }
  if (path == "/videos/presigned-url") {
    return is_get ? handle_presigned_url(query) : text_response(405, "Method not allowed");
  }
  if (path == "/videos/upload") {
    return is_post ? handle_upload(request, false) : text_response(405, "Method not allowed");
  }
  if (path == "/videos/photos") {
    return is_post ? handle_upload(request, true) : text_response(405, "Method not allowed");
  }
  if (boost::algorithm::starts_with(path, kStreamPrefix)) {
    const std::string rest = path.substr(std::string(kStreamPrefix).size());
    size_t slash = rest.find('/');
    if (is_get && slash != std::string::npos && rest.find('/', slash + 1) == std::string::npos) {
      return handle_stream(url_decode(rest.substr(0, slash)), url_decode(rest.substr(slash + 1)));
    }
    if (!is_get) {
      return text_response(405, "Method not allowed");
    }
  }

  nlohmann::json error;
  error["success"] = false;
  error["message"] = "Not found";
  return json_response(404, error);
}

HttpResponse HttpServer::handle_health() {
  nlohmann::json health;
  health["status"] = "ok";
  health["service"] = "kiln";
  health["version"] = KILN_VERSION_STRING;
  health["running"] = running_.load();
  health["workers"] = config_.workers;
  health["queue_depth"] = queue_.size();
  health["queue_capacity"] = queue_.capacity();
  health["requests_served"] = requests_served_.load();
  health["requests_rejected"] = requests_rejected_.load();
  return json_response(200, health);
}

HttpResponse HttpServer::handle_presigned_url(const std::string& query) {
  auto file_name = query_param(query, "fileName");
  if (!file_name || file_name->empty()) {
    return text_response(400, "Missing required parameter: fileName");
  }

  const std::string prefix = "Error generating pre-signed URL: ";
  try {
    return text_response(200, callbacks_.presigned_upload_url("uploads/" + *file_name));
  } catch (const media::InvalidInput& e) {
    return text_response(400, prefix + e.what());
  } catch (const std::exception& e) {
    KILN_LOG_ERROR("Presign failed" << logging::kv("file", *file_name) << logging::kv("error", e.what()));
    return text_response(500, prefix + e.what());
  }
}

HttpResponse HttpServer::handle_upload(const HttpRequest& request, bool photo) {
  const std::string prefix = "Upload failed: ";

  MultipartParser parser;
  std::vector<MultipartPart> parts;
  if (!parser.parse(request.content_type, request.body, parts)) {
    return text_response(400, prefix + parser.get_last_error());
  }
  const MultipartPart* file = find_part(parts, "file");
  if (file == nullptr) {
    return text_response(400, prefix + "Required part 'file' is not present.");
  }

  media::UploadRequest upload;
  upload.filename = file->filename;
  upload.content = file->data;
  upload.declared_size = file->data.size();
  upload.content_type = file->content_type;

  try {
    if (photo) {
      return text_response(200, callbacks_.upload_photo(upload).url);
    }
    return text_response(200, callbacks_.upload_video(upload));
  } catch (const media::InvalidInput& e) {
    return text_response(400, prefix + e.what());
  } catch (const std::exception& e) {
    return text_response(500, prefix + e.what());
  }
}

HttpResponse HttpServer::handle_stream(const std::string& video_prefix, const std::string& file_name) {
  if (!is_header_safe(video_prefix) || !is_header_safe(file_name)) {
    return text_response(400, "");
  }
  try {
    media::ChunkStream chunk = callbacks_.open_chunk(video_prefix, file_name);
    HttpResponse response;
    response.status = 200;
    response.content_type = chunk.content_type;
    response.body = std::move(chunk.bytes);
    response.headers.emplace_back("Cache-Control", "max-age=3600, public");
    response.headers.emplace_back("Content-Disposition", "inline;filename=\"" + file_name + "\"");
    return response;
  } catch (const storage::StoreError& e) {
    if (e.not_found()) {
      KILN_LOG_WARN("Chunk not found" << logging::kv("key", video_prefix + "/" + file_name));
      return text_response(404, "");
    }
    KILN_LOG_ERROR("Chunk retrieval failed" << logging::kv("error", e.what()));
    return text_response(500, "");
  } catch (const media::InvalidInput&) {
    return text_response(400, "");
  } catch (const std::exception& e) {
    KILN_LOG_ERROR("Chunk retrieval failed" << logging::kv("error", e.what()));
    return text_response(500, "");
  }
}

}  // namespace server
}  // namespace kiln
