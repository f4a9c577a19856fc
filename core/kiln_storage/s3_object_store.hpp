// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef KILN_S3_OBJECT_STORE_HPP
#define KILN_S3_OBJECT_STORE_HPP

#include <memory>
#include <string>

#include "object_store.hpp"

namespace kiln {
namespace storage {

/**
 * S3 connection options
 */
struct S3Config {
  std::string endpoint_url;  // e.g. "http://localhost:9000" for MinIO; empty for AWS S3
  std::string region = "us-east-1";
  bool use_ssl = true;
  bool verify_ssl = true;

  // If empty, read from AWS_ACCESS_KEY_ID and AWS_SECRET_ACCESS_KEY
  std::string access_key;
  std::string secret_key;

  int connect_timeout_ms = 10000;
  int request_timeout_ms = 60000;

  // ResilientStore owns retry policy, so the SDK's own retries stay off
  int max_sdk_retries = 0;
};

/**
 * IObjectStore backed by the AWS SDK for C++.
 *
 * Works against AWS S3 (virtual-hosted addressing) and S3-compatible
 * servers such as MinIO (path-style addressing, chosen whenever
 * endpoint_url is set).
 */
class S3ObjectStore : public IObjectStore {
public:
  explicit S3ObjectStore(const S3Config& config);
  ~S3ObjectStore() override;

  S3ObjectStore(const S3ObjectStore&) = delete;
  S3ObjectStore& operator=(const S3ObjectStore&) = delete;

  bool bucket_exists(const std::string& bucket) override;
  void make_bucket(const std::string& bucket) override;
  void put_object(
    const std::string& bucket, const std::string& key, std::istream& data, uint64_t length,
    const std::string& content_type
  ) override;
  std::string get_object(const std::string& bucket, const std::string& key) override;
  std::string presigned_url(
    const std::string& bucket, const std::string& key, HttpMethod method, int expiry_minutes
  ) override;

  const std::string& endpoint() const;

private:
  class Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace storage
}  // namespace kiln

#endif  // KILN_S3_OBJECT_STORE_HPP
