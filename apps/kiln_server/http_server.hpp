// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef KILN_SERVER_HTTP_SERVER_HPP
#define KILN_SERVER_HTTP_SERVER_HPP

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <nlohmann/json.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <media_pipeline.hpp>

#include "request_queue.hpp"
#include "server_config.hpp"

namespace kiln {
namespace server {

/**
 * Transport-independent view of one HTTP request
 */
struct HttpRequest {
  std::string method;
  std::string target;  // path plus optional query string
  std::string content_type;
  std::string body;
};

struct HttpResponse {
  int status = 200;
  std::string content_type = "text/plain";
  std::string body;
  std::vector<std::pair<std::string, std::string>> headers;
};

/**
 * HTTP front-end for the media pipeline.
 *
 * One thread accepts connections and hands each to a bounded RequestQueue;
 * a fixed pool of workers reads, routes and answers them. Routing goes
 * through the Callbacks so the server has no direct dependency on
 * MediaPipeline construction.
 */
class HttpServer {
public:
  using UploadVideoCallback = std::function<std::string(const media::UploadRequest&)>;
  using UploadPhotoCallback = std::function<media::PhotoUploadResult(const media::UploadRequest&)>;
  // Receives the full object name, e.g. "uploads/clip.mp4"
  using PresignUploadCallback = std::function<std::string(const std::string&)>;
  using OpenChunkCallback =
    std::function<media::ChunkStream(const std::string&, const std::string&)>;

  struct Callbacks {
    UploadVideoCallback upload_video;
    UploadPhotoCallback upload_photo;
    PresignUploadCallback presigned_upload_url;
    OpenChunkCallback open_chunk;
  };

  explicit HttpServer(const HttpServerConfig& config);

  /**
   * Destructor - stops the server
   */
  ~HttpServer();

  // Non-copyable, non-movable
  HttpServer(const HttpServer&) = delete;
  HttpServer& operator=(const HttpServer&) = delete;
  HttpServer(HttpServer&&) = delete;
  HttpServer& operator=(HttpServer&&) = delete;

  /**
   * Register route callbacks. Must be called before start()
   */
  void register_callbacks(const Callbacks& callbacks);

  /**
   * Bind, then start the accept thread and worker pool.
   *
   * @return true on success, false on failure (see get_last_error())
   */
  bool start();

  /**
   * Stop accepting, drop queued connections and join all threads
   */
  void stop();

  bool is_running() const;

  std::string get_url() const;

  std::string get_last_error() const;

  /**
   * Route one request. Used by the workers and callable directly in-process.
   */
  HttpResponse handle_request(const HttpRequest& request);

  /**
   * Number of connections waiting for a worker
   */
  size_t queue_depth() const {
    return queue_.size();
  }

private:
  // Accepted socket on its own io_context, so the serving worker can put a
  // deadline on each read and write
  struct Connection {
    std::unique_ptr<boost::asio::io_context> io_context;
    std::unique_ptr<boost::asio::ip::tcp::socket> socket;
  };

  void accept_loop();
  void worker_loop(int worker_id);
  void serve_connection(Connection& connection);
  void reject_busy(boost::asio::ip::tcp::socket& socket);

  HttpResponse handle_health();
  HttpResponse handle_presigned_url(const std::string& query);
  HttpResponse handle_upload(const HttpRequest& request, bool photo);
  HttpResponse handle_stream(const std::string& video_prefix, const std::string& file_name);

  void set_error_helper(const std::string& error);

  HttpServerConfig config_;
  Callbacks callbacks_;
  RequestQueue queue_;

  std::unique_ptr<boost::asio::io_context> io_context_;
  std::unique_ptr<boost::asio::ip::tcp::acceptor> acceptor_;
  std::unique_ptr<std::thread> accept_thread_;
  std::vector<std::thread> workers_;
  std::atomic<bool> running_;
  std::atomic<bool> stop_requested_;

  std::atomic<uint64_t> requests_served_{0};
  std::atomic<uint64_t> requests_rejected_{0};

  mutable std::mutex error_mutex_;
  std::string last_error_;
};

/**
 * Decode %XX escapes and '+' in a query-string component
 */
std::string url_decode(const std::string& value);

/**
 * Value of `key` in a query string such as "a=1&b=2"
 */
std::optional<std::string> query_param(const std::string& query, const std::string& key);

}  // namespace server
}  // namespace kiln

#endif  // KILN_SERVER_HTTP_SERVER_HPP
