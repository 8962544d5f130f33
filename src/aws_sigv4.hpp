#pragma once
#include <chrono>
#include <string>
#include <utility>
#include <vector>

struct AwsCredentials {
    std::string access_key_id;
    std::string secret_access_key;
    std::string session_token;

    bool empty() const { return access_key_id.empty() || secret_access_key.empty(); }
    // AWS_ACCESS_KEY_ID / AWS_SECRET_ACCESS_KEY / AWS_SESSION_TOKEN
    static AwsCredentials from_env();
};

std::string sha256_hex(const std::string& data);
std::string hmac_sha256(const std::string& key, const std::string& data);  // raw digest
std::string hex_encode(const std::string& raw);

// RFC 3986 encoding; unreserved characters pass through.
std::string uri_encode(const std::string& s, bool encode_slash);

// "20150830T123600Z"
std::string amz_timestamp(std::chrono::system_clock::time_point tp);

std::string derive_signing_key(const std::string& secret, const std::string& date,
                               const std::string& region, const std::string& service);

// Builds the Signature Version 4 Authorization header value. headers must
// include every header to be signed (host and x-amz-date at least); names are
// lower-cased and values trimmed here. canonical_uri is the already-encoded
// request path; it is encoded once more as non-S3 services require.
std::string sigv4_authorization(const AwsCredentials& creds,
                                const std::string& region,
                                const std::string& service,
                                const std::string& amz_date,
                                const std::string& method,
                                const std::string& canonical_uri,
                                const std::string& canonical_query,
                                std::vector<std::pair<std::string, std::string>> headers,
                                const std::string& payload);
