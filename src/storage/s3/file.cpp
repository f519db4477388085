#include "storage/s3/S3Controller.hpp"
#include "transfer/model/Error.hpp"
#include "log/Registry.hpp"

#include <fstream>
#include <fmt/core.h>

using namespace pt::cloud;
using namespace pt::util;
using namespace pt::transfer;
using namespace pt::transfer::model;
using namespace pt::log;

namespace {

// Body bytes go to `out` only for a 2xx reply; an error document is kept
// aside so it can be classified.
struct DownloadSink {
    CURL* handle = nullptr;
    std::ostream* out = nullptr;
    std::string errorBody;
};

size_t writeSink(const char* ptr, const size_t size, const size_t nmemb, void* userdata) {
    auto* sink = static_cast<DownloadSink*>(userdata);
    long status = 0;
    curl_easy_getinfo(sink->handle, CURLINFO_RESPONSE_CODE, &status);
    if (status / 100 != 2) {
        sink->errorBody.append(ptr, size * nmemb);
        return size * nmemb;
    }
    sink->out->write(ptr, static_cast<std::streamsize>(size * nmemb));
    return sink->out->good() ? size * nmemb : 0; // short count -> CURLE_WRITE_ERROR
}

}

std::string S3Controller::uploadObject(const fs::path& key, const fs::path& filePath, const Context& ctx) const {
    ctx.checkpoint();

    std::ifstream fin(filePath, std::ios::binary);
    if (!fin) throw TransferError(ErrorKind::LocalIOFailure, "Failed to open file for upload: " + filePath.string());

    const std::string fileContents = slurp(fin);
    const std::string payloadHash = sha256Hex(fileContents);

    CurlEasy tmpHandle;
    const auto [canonical, url] = constructPaths(static_cast<CURL*>(tmpHandle), key);

    SList hdrs = makeSigHeaders("PUT", canonical, payloadHash);
    hdrs.add("Content-Type: application/octet-stream");

    const HttpResponse resp = performCurl(ctx, [&](CURL* h) {
        curl_easy_setopt(h, CURLOPT_URL, url.c_str());
        curl_easy_setopt(h, CURLOPT_CUSTOMREQUEST, "PUT");
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, hdrs.get());
        curl_easy_setopt(h, CURLOPT_POSTFIELDS, fileContents.data());
        curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(fileContents.size()));
    });

    if (!resp.ok()) fail("PUT", key, resp);

    std::string etag;
    if (!extractETag(resp.hdr, etag))
        throw TransferError(ErrorKind::TransportFailure,
                            fmt::format("PUT s3://{}/{}: store did not acknowledge the object (no ETag)", bucket_, key.string()));

    Registry::cloud()->debug("[S3Controller] PUT {}/{} ({} bytes) etag={}", bucket_, key.string(), fileContents.size(), etag);
    return etag;
}

std::string S3Controller::uploadLargeObject(const fs::path& key,
                                            const fs::path& filePath,
                                            const uintmax_t partSize,
                                            const Context& ctx) const {
    std::ifstream file(filePath, std::ios::binary);
    if (!file) throw TransferError(ErrorKind::LocalIOFailure, "Failed to open file for large upload: " + filePath.string());

    const auto chunk = std::max(partSize, MIN_PART_SIZE);
    const std::string uploadId = initiateMultipartUpload(key, ctx);

    std::vector<std::string> etags;
    int partNo = 1;

    try {
        while (file) {
            ctx.checkpoint();

            std::string part(chunk, '\0');
            file.read(part.data(), static_cast<std::streamsize>(chunk));
            const std::streamsize bytesRead = file.gcount();
            if (bytesRead <= 0) break;

            part.resize(static_cast<size_t>(bytesRead));
            etags.push_back(uploadPart(key, uploadId, partNo++, part, ctx));
        }

        if (file.bad()) throw TransferError(ErrorKind::LocalIOFailure, "Read failed during large upload: " + filePath.string());
        if (etags.empty()) throw TransferError(ErrorKind::LocalIOFailure, "Nothing to upload from " + filePath.string());

        return completeMultipartUpload(key, uploadId, etags, ctx);
    } catch (const TransferError& e) {
        Registry::cloud()->error("[S3Controller] uploadLargeObject failed at part {} for {}: {}", partNo - 1, key.string(), e.what());

        // the caller's context may already be cancelled or expired; abort on a fresh one
        try {
            abortMultipartUpload(key, uploadId, Context{});
        } catch (const TransferError& abortErr) {
            Registry::cloud()->error("[S3Controller] Failed to abort multipart upload {} for {}: {}",
                                     uploadId, key.string(), abortErr.what());
        }
        throw;
    }
}

void S3Controller::downloadObject(const fs::path& key, std::ostream& out, const Context& ctx) const {
    streamGet(key, out, std::nullopt, ctx);
}

void S3Controller::downloadRange(const fs::path& key, std::ostream& out,
                                 const uintmax_t first, const uintmax_t last,
                                 const Context& ctx) const {
    if (last < first) throw std::invalid_argument("downloadRange: last < first");
    streamGet(key, out, fmt::format("bytes={}-{}", first, last), ctx);
}

void S3Controller::streamGet(const fs::path& key, std::ostream& out,
                             const std::optional<std::string>& range,
                             const Context& ctx) const {
    ctx.checkpoint();

    CurlEasy tmpHandle;
    const auto [canonicalPath, url] = constructPaths(static_cast<CURL*>(tmpHandle), key);

    SList headers = makeSigHeaders("GET", canonicalPath, "UNSIGNED-PAYLOAD");
    if (range) headers.add("Range: " + *range);

    DownloadSink sink;
    sink.out = &out;

    HttpResponse resp = performCurl(ctx, [&](CURL* h) {
        sink.handle = h;
        curl_easy_setopt(h, CURLOPT_URL, url.c_str());
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, headers.get());
        curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, writeSink);
        curl_easy_setopt(h, CURLOPT_WRITEDATA, &sink);
    });

    if (!resp.ok()) {
        resp.body = std::move(sink.errorBody);
        fail(range ? "GET (range)" : "GET", key, resp);
    }
}
