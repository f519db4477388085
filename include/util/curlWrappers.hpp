#pragma once

#include "util/s3Helpers.hpp"
#include "transfer/Context.hpp"
#include "transfer/model/Error.hpp"

#include <curl/curl.h>
#include <algorithm>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace pt::util {

class CurlEasy {
public:
    CurlEasy() : h_(curl_easy_init()) {
        if (!h_) throw std::runtime_error("curl_easy_init failed");
        curl_easy_setopt(h_, CURLOPT_NOPROGRESS, 1L);
        curl_easy_setopt(h_, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(h_, CURLOPT_NOSIGNAL, 1L);
    }
    ~CurlEasy() { curl_easy_cleanup(h_); }

    CurlEasy(const CurlEasy&) = delete;
    CurlEasy& operator=(const CurlEasy&) = delete;

    operator CURL*()       { return h_; }
    operator const CURL*() const { return h_; }

private:
    CURL* h_;
};

class SList {
public:
    SList() = default;
    SList(SList&& other) noexcept : store_(std::move(other.store_)), head_(other.head_) { other.head_ = nullptr; }
    SList(const SList&) = delete;
    SList& operator=(const SList&) = delete;

    void add(std::string s) {
        store_.push_back(std::move(s));
        head_ = curl_slist_append(head_, store_.back().c_str());
    }
    ~SList() { curl_slist_free_all(head_); }
    curl_slist* get() const { return head_; }

private:
    std::vector<std::string> store_;
    curl_slist*              head_ = nullptr;
};

struct HttpResponse {
    CURLcode curl  = CURLE_OK;
    long     http  = 0;
    std::string body;
    std::string hdr;
    curl_off_t contentLength = -1;   // final response only; -1 when the server sent none
    bool ok() const { return curl == CURLE_OK && http / 100 == 2; }
};

// A body is complete when it matches the final response's Content-Length,
// or when that response carried none (chunked).
inline bool completeBody(const curl_off_t expected, const std::uintmax_t written) {
    return expected < 0 || static_cast<std::uintmax_t>(expected) == written;
}

inline transfer::model::ErrorKind classifyCurl(const CURLcode code) {
    using transfer::model::ErrorKind;
    switch (code) {
    case CURLE_OPERATION_TIMEDOUT: return ErrorKind::NetworkTimeout;
    case CURLE_ABORTED_BY_CALLBACK: return ErrorKind::Cancelled;
    case CURLE_WRITE_ERROR:
    case CURLE_READ_ERROR: return ErrorKind::LocalIOFailure;
    case CURLE_LOGIN_DENIED:
    case CURLE_PEER_FAILED_VERIFICATION: return ErrorKind::AuthenticationFailure;
    case CURLE_REMOTE_FILE_NOT_FOUND: return ErrorKind::ObjectNotFound;
    default: return ErrorKind::TransportFailure;
    }
}

inline transfer::model::ErrorKind classifyHttpStatus(const long status) {
    using transfer::model::ErrorKind;
    if (status == 401 || status == 403) return ErrorKind::AuthenticationFailure;
    if (status == 404 || status == 410) return ErrorKind::ObjectNotFound;
    if (status == 408 || status == 504) return ErrorKind::NetworkTimeout;
    return ErrorKind::TransportFailure;
}

// Deadline becomes CURLOPT_TIMEOUT_MS; the interrupt flag aborts through the
// progress callback (CURLE_ABORTED_BY_CALLBACK).
inline void applyContext(CURL* h, const transfer::Context& ctx) {
    if (const auto left = ctx.remaining())
        curl_easy_setopt(h, CURLOPT_TIMEOUT_MS, static_cast<long>(std::max<long long>(left->count(), 1)));

    if (ctx.interruptFlag) {
        curl_easy_setopt(h, CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(h, CURLOPT_XFERINFODATA, &ctx);
        curl_easy_setopt(h, CURLOPT_XFERINFOFUNCTION,
            +[](void* ud, curl_off_t, curl_off_t, curl_off_t, curl_off_t) -> int {
                return static_cast<const transfer::Context*>(ud)->isInterrupted() ? 1 : 0;
            });
    }
}

template <class SetupFn>
static HttpResponse performCurl(const transfer::Context& ctx, SetupFn&& setup) {
    CurlEasy h;                    // RAII handle
    std::string bodyBuf, hdrBuf;

    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, writeToString);
    curl_easy_setopt(h, CURLOPT_WRITEDATA,  &bodyBuf);
    curl_easy_setopt(h, CURLOPT_HEADERFUNCTION, writeToString);
    curl_easy_setopt(h, CURLOPT_HEADERDATA, &hdrBuf);
    applyContext(h, ctx);

    setup(h);                      // caller-specific tweaks

    HttpResponse r;
    r.curl = curl_easy_perform(h);
    curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &r.http);
    curl_easy_getinfo(h, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &r.contentLength);
    r.body.swap(bodyBuf);
    r.hdr.swap(hdrBuf);
    return r;
}

}
