#include "storage/s3/S3Controller.hpp"
#include "util/timestamp.hpp"
#include "log/Registry.hpp"

#include <cstdlib>

using namespace pt::cloud;
using namespace pt::util;
using namespace pt::transfer;
using namespace pt::log;

std::map<std::string, std::string> S3Controller::buildHeaderMap(const std::string& payloadHash) const {
    return {
                {"host", creds_.endpoint.substr(creds_.endpoint.find("//") + 2)},
                {"x-amz-content-sha256", payloadHash},
                {"x-amz-date", getCurrentTimestamp()}
    };
}

SList S3Controller::makeSigHeaders(const std::string& method,
                                   const std::string& canonical,
                                   const std::string& payloadHash) const {
    auto base = buildHeaderMap(payloadHash);      // host + dates
    const auto auth = buildAuthorizationHeader(signing_, method, canonical, base, payloadHash);

    SList out;
    out.add("Authorization: " + auth);
    for (auto& [k, v] : base) out.add(k + ": " + v);
    return out;  // RAII slist
}

std::optional<ObjectHead> S3Controller::headObject(const fs::path& key, const Context& ctx) const {
    ctx.checkpoint();

    CurlEasy tmpHandle;
    const auto [canonicalPath, url] = constructPaths(static_cast<CURL*>(tmpHandle), key);
    SList headers = makeSigHeaders("HEAD", canonicalPath, "UNSIGNED-PAYLOAD");

    const HttpResponse resp = performCurl(ctx, [&](CURL* h) {
        curl_easy_setopt(h, CURLOPT_URL, url.c_str());
        curl_easy_setopt(h, CURLOPT_NOBODY, 1L);            // HEAD request
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, headers.get());
    });

    if (resp.curl == CURLE_OK && resp.http == 404) return std::nullopt;
    if (!resp.ok()) fail("HEAD", key, resp);

    ObjectHead head;
    head.headers = parseResponseHeaders(resp.hdr);
    if (const auto it = head.headers.find("content-length"); it != head.headers.end())
        head.size = std::strtoull(it->second.c_str(), nullptr, 10);
    if (const auto it = head.headers.find("etag"); it != head.headers.end())
        head.etag = it->second;

    Registry::cloud()->debug("[S3Controller] HEAD {}/{} -> {} bytes", bucket_, key.string(), head.size);
    return head;
}
