#include "aws_sigv4.hpp"
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

AwsCredentials AwsCredentials::from_env() {
    AwsCredentials c;
    if (const char* v = std::getenv("AWS_ACCESS_KEY_ID")) c.access_key_id = v;
    if (const char* v = std::getenv("AWS_SECRET_ACCESS_KEY")) c.secret_access_key = v;
    if (const char* v = std::getenv("AWS_SESSION_TOKEN")) c.session_token = v;
    return c;
}

std::string hex_encode(const std::string& raw) {
    std::ostringstream ss;
    for (unsigned char c : raw) ss << std::hex << std::setw(2) << std::setfill('0') << (int)c;
    return ss.str();
}

std::string sha256_hex(const std::string& data) {
    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (EVP_Digest(data.data(), data.size(), md, &len, EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("sha256 failed");
    }
    return hex_encode(std::string(reinterpret_cast<const char*>(md), len));
}

std::string hmac_sha256(const std::string& key, const std::string& data) {
    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (!HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
              reinterpret_cast<const unsigned char*>(data.data()), data.size(), md, &len)) {
        throw std::runtime_error("hmac-sha256 failed");
    }
    return std::string(reinterpret_cast<const char*>(md), len);
}

std::string uri_encode(const std::string& s, bool encode_slash) {
    std::ostringstream out;
    for (unsigned char c : s) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~' || (c == '/' && !encode_slash)) {
            out << c;
        } else {
            out << '%' << std::uppercase << std::hex << std::setw(2) << std::setfill('0') << (int)c
                << std::nouppercase << std::dec;
        }
    }
    return out.str();
}

std::string amz_timestamp(std::chrono::system_clock::time_point tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[17];
    std::strftime(buf, sizeof(buf), "%Y%m%dT%H%M%SZ", &tm);
    return buf;
}

std::string derive_signing_key(const std::string& secret, const std::string& date,
                               const std::string& region, const std::string& service) {
    std::string k_date = hmac_sha256("AWS4" + secret, date);
    std::string k_region = hmac_sha256(k_date, region);
    std::string k_service = hmac_sha256(k_region, service);
    return hmac_sha256(k_service, "aws4_request");
}

static std::string trim_header_value(const std::string& v) {
    auto b = v.find_first_not_of(" \t");
    if (b == std::string::npos) return "";
    auto e = v.find_last_not_of(" \t");
    std::string out;
    bool in_space = false;
    for (auto i = b; i <= e; ++i) {
        char c = v[i];
        if (c == ' ' || c == '\t') {
            if (!in_space) out.push_back(' ');
            in_space = true;
        } else {
            out.push_back(c);
            in_space = false;
        }
    }
    return out;
}

std::string sigv4_authorization(const AwsCredentials& creds,
                                const std::string& region,
                                const std::string& service,
                                const std::string& amz_date,
                                const std::string& method,
                                const std::string& canonical_uri,
                                const std::string& canonical_query,
                                std::vector<std::pair<std::string, std::string>> headers,
                                const std::string& payload) {
    for (auto& [name, value] : headers) {
        std::transform(name.begin(), name.end(), name.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        value = trim_header_value(value);
    }
    std::sort(headers.begin(), headers.end());

    std::string canonical_headers;
    std::string signed_headers;
    for (const auto& [name, value] : headers) {
        canonical_headers += name + ":" + value + "\n";
        if (!signed_headers.empty()) signed_headers += ";";
        signed_headers += name;
    }

    const std::string uri = canonical_uri.empty() ? "/" : uri_encode(canonical_uri, false);
    const std::string canonical_request = method + "\n" + uri + "\n" + canonical_query + "\n" +
                                          canonical_headers + "\n" + signed_headers + "\n" +
                                          sha256_hex(payload);

    const std::string date = amz_date.substr(0, 8);
    const std::string scope = date + "/" + region + "/" + service + "/aws4_request";
    const std::string string_to_sign = "AWS4-HMAC-SHA256\n" + amz_date + "\n" + scope + "\n" +
                                       sha256_hex(canonical_request);

    const std::string key = derive_signing_key(creds.secret_access_key, date, region, service);
    const std::string signature = hex_encode(hmac_sha256(key, string_to_sign));

    return "AWS4-HMAC-SHA256 Credential=" + creds.access_key_id + "/" + scope +
           ", SignedHeaders=" + signed_headers + ", Signature=" + signature;
}
