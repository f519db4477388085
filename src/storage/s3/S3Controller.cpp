#include "storage/s3/S3Controller.hpp"
#include "transfer/model/Error.hpp"
#include "log/Registry.hpp"

#include <fmt/core.h>

using namespace pt::cloud;
using namespace pt::util;
using namespace pt::transfer;
using namespace pt::transfer::model;
using namespace pt::log;

S3Controller::S3Controller(storage::ObjectStoreCredentials creds, std::string bucket)
    : creds_(std::move(creds)), bucket_(std::move(bucket)) {
    if (creds_.endpoint.find("//") == std::string::npos)
        throw std::invalid_argument("S3Controller: endpoint must include a scheme: " + creds_.endpoint);
    if (bucket_.empty()) throw std::invalid_argument("S3Controller: empty bucket");
    signing_ = {creds_.access_key, creds_.secret_access_key, creds_.region};
    ensureCurlGlobalInit();
}

std::pair<std::string, std::string> S3Controller::constructPaths(CURL* curl, const fs::path& p, const std::string& query) const {
    const auto escapedKey = escapeKeyPreserveSlashes(curl, p);
    const auto canonicalPath = "/" + bucket_ + "/" + escapedKey + query;
    const auto url = creds_.endpoint + canonicalPath;
    return {canonicalPath, url};
}

void S3Controller::fail(const std::string& op, const fs::path& key, const HttpResponse& resp) const {
    const auto kind = resp.curl != CURLE_OK ? classifyCurl(resp.curl) : classifyS3Error(resp.http, resp.body);
    const auto detail = resp.curl != CURLE_OK
        ? std::string(curl_easy_strerror(resp.curl))
        : fmt::format("HTTP {} {}", resp.http, parseS3ErrorCode(resp.body).value_or(""));

    Registry::cloud()->error("[S3Controller] {} failed for {}/{}: {}", op, bucket_, key.string(), detail);
    throw TransferError(kind, fmt::format("{} s3://{}/{}: {}", op, bucket_, key.string(), detail));
}
