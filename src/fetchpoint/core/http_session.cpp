// Copyright (c) 2026 fetchpoint contributors. All rights reserved.

#include <fetchpoint/core/http_session.hpp>
#include <fetchpoint/core/config.hpp>
#include <fetchpoint/disk/file.hpp>
#include <curl/curl.h>
#include <spdlog/spdlog.h>
#include <algorithm>

namespace fetchpoint::core {

namespace {

// RAII curl handle cleanup
struct CurlHandle {
    CURL* ptr = nullptr;

    CurlHandle() = default;
    explicit CurlHandle(CURL* c) : ptr(c) {}
    ~CurlHandle() { if (ptr) curl_easy_cleanup(ptr); }

    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;
};

// RAII request header list
struct HeaderList {
    curl_slist* ptr = nullptr;

    HeaderList() = default;
    ~HeaderList() { if (ptr) curl_slist_free_all(ptr); }

    HeaderList(const HeaderList&) = delete;
    HeaderList& operator=(const HeaderList&) = delete;

    void append(const std::string& header) noexcept {
        if (auto* next = curl_slist_append(ptr, header.c_str())) {
            ptr = next;
        }
    }
};

// Write callback: stream the body straight to disk
struct BodySink {
    disk::File* file = nullptr;
    std::error_code error;
};

std::size_t write_callback(char* ptr, std::size_t size, std::size_t nmemb, void* userdata) noexcept {
    auto* sink = static_cast<BodySink*>(userdata);
    std::size_t bytes = size * nmemb;
    if (!sink || !sink->file) return 0;

    if (auto ec = sink->file->write(ptr, bytes)) {
        sink->error = ec;
        // Returning less than `bytes` aborts the transfer
        return 0;
    }
    return bytes;
}

std::error_code curl_error(CURLcode code) noexcept {
    switch (code) {
        case CURLE_OPERATION_TIMEDOUT:
            return make_error_code(FetchErrc::timeout);
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
            return make_error_code(FetchErrc::dns_error);
        case CURLE_COULDNT_CONNECT:
            return make_error_code(FetchErrc::refused);
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PEER_FAILED_VERIFICATION:
        case CURLE_SSL_CERTPROBLEM:
        case CURLE_SSL_CIPHER:
        case CURLE_SSL_CACERT_BADFILE:
            return make_error_code(FetchErrc::ssl_error);
        case CURLE_TOO_MANY_REDIRECTS:
            return make_error_code(FetchErrc::too_many_redirects);
        case CURLE_RECV_ERROR:
        case CURLE_SEND_ERROR:
        case CURLE_GOT_NOTHING:
        case CURLE_PARTIAL_FILE:
            return make_error_code(FetchErrc::connection_lost);
        case CURLE_WRITE_ERROR:
            return make_error_code(FetchErrc::write_failed);
        case CURLE_URL_MALFORMAT:
        case CURLE_UNSUPPORTED_PROTOCOL:
            return make_error_code(FetchErrc::invalid_url);
        case CURLE_ABORTED_BY_CALLBACK:
            return make_error_code(FetchErrc::cancelled);
        default:
            return make_error_code(FetchErrc::network_error);
    }
}

// Options shared by GET and HEAD
void apply_common_options(CURL* curl, const std::string& url, std::chrono::seconds timeout,
                          const HeaderList& headers) noexcept {
    const long total_timeout = static_cast<long>(std::max<std::int64_t>(1, timeout.count()));
    const long connect_timeout = std::min<long>(total_timeout, CONNECTION_TIMEOUT_SEC);

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, static_cast<long>(MAX_REDIRECTS));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, connect_timeout);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, total_timeout);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);  // Required with several threads
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, USER_AGENT.data());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers.ptr);
}

void fill_request_headers(HeaderList& headers) noexcept {
    headers.append("Accept: " + std::string(ACCEPT_HEADER));
    headers.append("Accept-Language: " + std::string(ACCEPT_LANGUAGE_HEADER));
}

} // namespace

//=============================================================================
// HttpSession
//=============================================================================

std::error_code HttpSession::status_error(long http_code) noexcept {
    if (http_code >= 200 && http_code < 300) return {};
    if (http_code == 404 || http_code == 410) return make_error_code(FetchErrc::not_found);
    if (http_code == 401 || http_code == 403) return make_error_code(FetchErrc::forbidden);
    if (http_code == 429) return make_error_code(FetchErrc::rate_limited);
    if (http_code >= 500) return make_error_code(FetchErrc::server_error);
    return make_error_code(FetchErrc::http_error);
}

std::expected<FetchResult, std::error_code>
HttpSession::fetch(const std::string& url,
                   const std::filesystem::path& destination,
                   std::chrono::seconds timeout) noexcept {
    CurlHandle curl(curl_easy_init());
    if (!curl.ptr) {
        return std::unexpected(make_error_code(FetchErrc::network_error));
    }

    auto file = disk::File::create(destination);
    if (!file) {
        spdlog::debug("Cannot create {}: {}", destination.string(), file.error().message());
        return std::unexpected(make_error_code(FetchErrc::write_failed));
    }

    HeaderList headers;
    fill_request_headers(headers);

    apply_common_options(curl.ptr, url, timeout, headers);

    BodySink sink{&*file, {}};
    curl_easy_setopt(curl.ptr, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl.ptr, CURLOPT_WRITEDATA, &sink);

    CURLcode result = curl_easy_perform(curl.ptr);

    long http_code = 0;
    curl_easy_getinfo(curl.ptr, CURLINFO_RESPONSE_CODE, &http_code);

    FetchResult response;
    response.status_code = static_cast<std::int32_t>(http_code);
    response.bytes = file->bytes_written();

    if (result != CURLE_OK) {
        if (sink.error) {
            spdlog::debug("Write to {} failed: {}", destination.string(), sink.error.message());
            return std::unexpected(make_error_code(FetchErrc::write_failed));
        }
        spdlog::debug("GET {} failed: {}", url, curl_easy_strerror(result));
        return std::unexpected(curl_error(result));
    }

    if (auto ec = status_error(http_code)) {
        spdlog::debug("GET {} returned HTTP {}", url, http_code);
        return std::unexpected(ec);
    }

    if (response.bytes == 0) {
        return std::unexpected(make_error_code(FetchErrc::empty_body));
    }

    if (file->sync() || file->close()) {
        return std::unexpected(make_error_code(FetchErrc::write_failed));
    }

    return response;
}

bool HttpSession::answered(long http_code) noexcept {
    return http_code >= 100 && http_code < 600;
}

std::expected<ProbeResult, std::error_code>
HttpSession::probe(const std::string& url, std::chrono::seconds timeout) noexcept {
    CurlHandle curl(curl_easy_init());
    if (!curl.ptr) {
        return std::unexpected(make_error_code(FetchErrc::network_error));
    }

    HeaderList headers;
    fill_request_headers(headers);

    apply_common_options(curl.ptr, url, timeout, headers);
    curl_easy_setopt(curl.ptr, CURLOPT_NOBODY, 1L);

    CURLcode result = curl_easy_perform(curl.ptr);
    if (result != CURLE_OK) {
        spdlog::debug("HEAD {} failed: {}", url, curl_easy_strerror(result));
        return std::unexpected(curl_error(result));
    }

    long http_code = 0;
    curl_easy_getinfo(curl.ptr, CURLINFO_RESPONSE_CODE, &http_code);

    // Any status means a server answered; only transport failures count
    if (!answered(http_code)) {
        spdlog::debug("HEAD {} produced no HTTP status", url);
        return std::unexpected(make_error_code(FetchErrc::network_error));
    }

    ProbeResult response;
    response.status_code = static_cast<std::int32_t>(http_code);
    response.error = status_error(http_code);
    return response;
}

//=============================================================================
// Global CURL initialization
//=============================================================================

void HttpSession::global_init() noexcept {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

void HttpSession::global_cleanup() noexcept {
    curl_global_cleanup();
}

} // namespace fetchpoint::core
