#include "storage/s3/S3Controller.hpp"
#include "transfer/model/Error.hpp"
#include "log/Registry.hpp"

#include <fmt/core.h>

using namespace pt::cloud;
using namespace pt::util;
using namespace pt::transfer;
using namespace pt::transfer::model;
using namespace pt::log;

std::string S3Controller::initiateMultipartUpload(const fs::path& key, const Context& ctx) const {
    ctx.checkpoint();

    CurlEasy tmpHandle;
    const auto [canonicalPath, url] = constructPaths(static_cast<CURL*>(tmpHandle), key, "?uploads");
    SList headers = makeSigHeaders("POST", canonicalPath, "UNSIGNED-PAYLOAD");

    const HttpResponse resp = performCurl(ctx, [&](CURL* h) {
        curl_easy_setopt(h, CURLOPT_URL, url.c_str());
        curl_easy_setopt(h, CURLOPT_POST, 1L);
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, headers.get());
        curl_easy_setopt(h, CURLOPT_POSTFIELDS, "");
        curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(0));
    });

    if (!resp.ok()) fail("InitiateMultipartUpload", key, resp);

    const auto uploadId = parseUploadId(resp.body);
    if (!uploadId) {
        Registry::cloud()->error("[S3Controller] No UploadId in response: {}", resp.body);
        throw TransferError(ErrorKind::TransportFailure,
                            fmt::format("InitiateMultipartUpload s3://{}/{}: no UploadId in reply", bucket_, key.string()));
    }
    return *uploadId;
}

std::string S3Controller::uploadPart(const fs::path& key, const std::string& uploadId,
                                     const int partNumber, const std::string& partData,
                                     const Context& ctx) const {
    CurlEasy tmpHandle;
    const std::string query = "?partNumber=" + std::to_string(partNumber) + "&uploadId=" + uploadId;
    const auto [canonicalPath, url] = constructPaths(static_cast<CURL*>(tmpHandle), key, query);

    SList headers = makeSigHeaders("PUT", canonicalPath, sha256Hex(partData));
    headers.add("Content-Type: application/octet-stream");

    const HttpResponse resp = performCurl(ctx, [&](CURL* h) {
        curl_easy_setopt(h, CURLOPT_URL, url.c_str());
        curl_easy_setopt(h, CURLOPT_CUSTOMREQUEST, "PUT");
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, headers.get());
        curl_easy_setopt(h, CURLOPT_POSTFIELDS, partData.data());
        curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(partData.size()));
    });

    if (!resp.ok()) fail(fmt::format("UploadPart #{}", partNumber), key, resp);

    std::string etag;
    if (!extractETag(resp.hdr, etag))
        throw TransferError(ErrorKind::TransportFailure,
                            fmt::format("UploadPart #{} s3://{}/{}: no ETag in reply", partNumber, bucket_, key.string()));
    return etag;
}

std::string S3Controller::completeMultipartUpload(const fs::path& key, const std::string& uploadId,
                                                  const std::vector<std::string>& etags,
                                                  const Context& ctx) const {
    if (etags.empty()) throw std::invalid_argument("completeMultipartUpload: no parts");
    ctx.checkpoint();

    CurlEasy tmpHandle;
    const auto [canonicalPath, url] = constructPaths(static_cast<CURL*>(tmpHandle), key, "?uploadId=" + uploadId);

    const auto body = composeMultiPartUploadXMLBody(etags);
    SList headers = makeSigHeaders("POST", canonicalPath, sha256Hex(body));
    headers.add("Content-Type: application/xml");

    const HttpResponse resp = performCurl(ctx, [&](CURL* h) {
        curl_easy_setopt(h, CURLOPT_URL, url.c_str());
        curl_easy_setopt(h, CURLOPT_POST, 1L);
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, headers.get());
        curl_easy_setopt(h, CURLOPT_POSTFIELDS, body.data());
        curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(body.size()));
    });

    // S3 can answer 200 with an <Error> document when completion fails late
    if (!resp.ok() || parseS3ErrorCode(resp.body)) {
        auto failed = resp;
        if (failed.ok()) failed.http = 500;
        fail("CompleteMultipartUpload", key, failed);
    }

    const auto etag = parseCompleteMultipartETag(resp.body);
    if (!etag)
        throw TransferError(ErrorKind::TransportFailure,
                            fmt::format("CompleteMultipartUpload s3://{}/{}: no ETag in reply", bucket_, key.string()));

    Registry::cloud()->debug("[S3Controller] Completed multipart upload of {}/{} in {} parts", bucket_, key.string(), etags.size());
    return *etag;
}

void S3Controller::abortMultipartUpload(const fs::path& key, const std::string& uploadId, const Context& ctx) const {
    CurlEasy tmpHandle;
    const auto [canonicalPath, url] = constructPaths(static_cast<CURL*>(tmpHandle), key, "?uploadId=" + uploadId);
    SList headers = makeSigHeaders("DELETE", canonicalPath, sha256Hex(""));

    const HttpResponse resp = performCurl(ctx, [&](CURL* h) {
        curl_easy_setopt(h, CURLOPT_URL, url.c_str());
        curl_easy_setopt(h, CURLOPT_CUSTOMREQUEST, "DELETE");
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, headers.get());
    });

    if (!resp.ok()) fail("AbortMultipartUpload", key, resp);
}
