// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "s3_object_store.hpp"

#include <aws/core/Aws.h>
#include <aws/core/auth/AWSCredentials.h>
#include <aws/core/client/DefaultRetryStrategy.h>
#include <aws/core/http/HttpTypes.h>
#include <aws/core/utils/memory/stl/AWSStringStream.h>
#include <aws/s3/S3Client.h>
#include <aws/s3/S3Errors.h>
#include <aws/s3/model/CreateBucketRequest.h>
#include <aws/s3/model/GetObjectRequest.h>
#include <aws/s3/model/HeadBucketRequest.h>
#include <aws/s3/model/PutObjectRequest.h>

#include <cstdlib>
#include <mutex>
#include <sstream>

#include "retry_handler.hpp"

#define KILN_LOG_COMPONENT "s3_store"
#include <kiln_log_macros.hpp>

namespace kiln {
namespace storage {

// =============================================================================
// AWS SDK Lifecycle Management
// =============================================================================
// InitAPI/ShutdownAPI must run once per process; stores share a ref count.
// =============================================================================

class AwsSdkManager {
public:
  static AwsSdkManager& instance() {
    static AwsSdkManager instance;
    return instance;
  }

  void addRef() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (ref_count_++ == 0) {
      options_.loggingOptions.logLevel = Aws::Utils::Logging::LogLevel::Off;
      Aws::InitAPI(options_);
    }
  }

  void release() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (ref_count_ > 0 && --ref_count_ == 0) {
      Aws::ShutdownAPI(options_);
    }
  }

private:
  AwsSdkManager() = default;

  std::mutex mutex_;
  int ref_count_ = 0;
  Aws::SDKOptions options_;
};

namespace {

template <typename ErrorT>
StoreError translate(const char* operation, const std::string& key, const ErrorT& error) {
  std::string code = error.GetExceptionName();
  bool retryable = error.ShouldRetry();

  const auto type = error.GetErrorType();
  if (type == Aws::S3::S3Errors::NO_SUCH_KEY ||
      error.GetResponseCode() == Aws::Http::HttpResponseCode::NOT_FOUND) {
    code = "NoSuchKey";
    retryable = false;
  } else if (type == Aws::S3::S3Errors::NO_SUCH_BUCKET) {
    code = "NoSuchBucket";
    retryable = false;
  } else if (type == Aws::S3::S3Errors::NETWORK_CONNECTION) {
    code = "NetworkingError";
    retryable = true;
  }
  if (code.empty()) {
    code = "UnknownError";
  }
  retryable = retryable || RetryHandler::isRetryableError(code);

  std::string message = error.GetMessage();
  if (message.empty()) {
    message = code;
  }
  return StoreError(
    std::string(operation) + " " + key + ": " + message, code, retryable
  );
}

}  // namespace

// =============================================================================
// S3ObjectStore Implementation
// =============================================================================

class S3ObjectStore::Impl {
public:
  S3Config config;
  std::shared_ptr<Aws::S3::S3Client> client;

  Impl() {
    AwsSdkManager::instance().addRef();
  }

  ~Impl() {
    // SDK objects must go before the SDK itself may be shut down
    client.reset();
    AwsSdkManager::instance().release();
  }

  void initClient() {
    Aws::Client::ClientConfiguration client_config;
    client_config.region = config.region;

    if (!config.endpoint_url.empty()) {
      std::string endpoint = config.endpoint_url;
      if (endpoint.back() == '/') {
        endpoint.pop_back();
      }
      client_config.endpointOverride = endpoint;
    }

    client_config.verifySSL = config.verify_ssl;
    client_config.scheme = config.use_ssl ? Aws::Http::Scheme::HTTPS : Aws::Http::Scheme::HTTP;
    client_config.connectTimeoutMs = config.connect_timeout_ms;
    client_config.requestTimeoutMs = config.request_timeout_ms;
    client_config.retryStrategy =
      Aws::MakeShared<Aws::Client::DefaultRetryStrategy>("KilnS3", config.max_sdk_retries);

    Aws::Auth::AWSCredentials credentials(config.access_key, config.secret_key);

    // Path-style addressing for custom endpoints (MinIO), virtual-hosted for AWS
    const bool use_virtual_addressing = config.endpoint_url.empty();

    client = std::make_shared<Aws::S3::S3Client>(
      credentials,
      client_config,
      Aws::Client::AWSAuthV4Signer::PayloadSigningPolicy::Never,
      use_virtual_addressing
    );
  }
};

S3ObjectStore::S3ObjectStore(const S3Config& config)
    : impl_(std::make_unique<Impl>()) {
  impl_->config = config;

  if (impl_->config.access_key.empty()) {
    if (const char* key = std::getenv("AWS_ACCESS_KEY_ID")) {
      impl_->config.access_key = key;
    }
  }
  if (impl_->config.secret_key.empty()) {
    if (const char* key = std::getenv("AWS_SECRET_ACCESS_KEY")) {
      impl_->config.secret_key = key;
    }
  }

  impl_->initClient();
  KILN_LOG_INFO(
    "S3 object store ready" << logging::kv("endpoint", impl_->config.endpoint_url)
                            << logging::kv("region", impl_->config.region)
  );
}

S3ObjectStore::~S3ObjectStore() = default;

bool S3ObjectStore::bucket_exists(const std::string& bucket) {
  Aws::S3::Model::HeadBucketRequest request;
  request.SetBucket(bucket);

  auto outcome = impl_->client->HeadBucket(request);
  if (outcome.IsSuccess()) {
    return true;
  }
  StoreError error = translate("HeadBucket", bucket, outcome.GetError());
  if (error.not_found()) {
    return false;
  }
  throw error;
}

void S3ObjectStore::make_bucket(const std::string& bucket) {
  Aws::S3::Model::CreateBucketRequest request;
  request.SetBucket(bucket);

  auto outcome = impl_->client->CreateBucket(request);
  if (!outcome.IsSuccess()) {
    const auto type = outcome.GetError().GetErrorType();
    // Lost a creation race with another worker
    if (type == Aws::S3::S3Errors::BUCKET_ALREADY_OWNED_BY_YOU) {
      return;
    }
    throw translate("CreateBucket", bucket, outcome.GetError());
  }
}

void S3ObjectStore::put_object(
  const std::string& bucket, const std::string& key, std::istream& data, uint64_t length,
  const std::string& content_type
) {
  auto body = Aws::MakeShared<Aws::StringStream>("KilnS3Put");
  *body << data.rdbuf();
  if (data.bad()) {
    throw StoreError("PutObject " + key + ": failed reading source stream", "ReadError", false);
  }

  Aws::S3::Model::PutObjectRequest request;
  request.SetBucket(bucket);
  request.SetKey(key);
  request.SetContentType(content_type);
  request.SetContentLength(static_cast<long long>(length));
  request.SetBody(body);

  auto outcome = impl_->client->PutObject(request);
  if (!outcome.IsSuccess()) {
    throw translate("PutObject", key, outcome.GetError());
  }
  KILN_LOG_DEBUG(
    "PutObject ok" << logging::kv("bucket", bucket) << logging::kv("key", key)
                   << logging::kv("bytes", length)
  );
}

std::string S3ObjectStore::get_object(const std::string& bucket, const std::string& key) {
  Aws::S3::Model::GetObjectRequest request;
  request.SetBucket(bucket);
  request.SetKey(key);

  auto outcome = impl_->client->GetObject(request);
  if (!outcome.IsSuccess()) {
    throw translate("GetObject", key, outcome.GetError());
  }
  std::ostringstream out;
  out << outcome.GetResult().GetBody().rdbuf();
  return out.str();
}

std::string S3ObjectStore::presigned_url(
  const std::string& bucket, const std::string& key, HttpMethod method, int expiry_minutes
) {
  const auto aws_method =
    method == HttpMethod::GET ? Aws::Http::HttpMethod::HTTP_GET : Aws::Http::HttpMethod::HTTP_PUT;
  Aws::String url = impl_->client->GeneratePresignedUrl(
    bucket, key, aws_method, static_cast<uint64_t>(expiry_minutes) * 60
  );
  if (url.empty()) {
    throw StoreError(
      std::string("Presign ") + to_string(method) + " " + key + ": signer returned no URL",
      "PresignFailed", false
    );
  }
  return std::string(url.c_str(), url.size());
}

const std::string& S3ObjectStore::endpoint() const {
  return impl_->config.endpoint_url;
}

}  // namespace storage
}  // namespace kiln
