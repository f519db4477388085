#pragma once

#include "transfer/model/Error.hpp"

#include <filesystem>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <vector>
#include <curl/curl.h>

namespace pt::util {

struct SigV4Credentials {
    std::string access_key;
    std::string secret_access_key;
    std::string region;
};

std::string sha256Hex(const std::string& data);
std::string hmacSha256Raw(const std::string& key, const std::string& data);
std::string hmacSha256HexFromRaw(const std::string& rawKey, const std::string& data);
std::string escapeKeyPreserveSlashes(CURL* curl, const std::filesystem::path& p);
std::string composeMultiPartUploadXMLBody(const std::vector<std::string>& etags);
size_t writeToString(const char* ptr, size_t size, size_t nmemb, void* userdata);
[[nodiscard]] bool extractETag(const std::string& respHdr, std::string& etagOut);

// `headers` must contain x-amz-date; the credential scope date is taken from it.
std::string buildAuthorizationHeader(const SigV4Credentials& creds,
                                     const std::string& method, const std::string& fullPath,
                                     const std::map<std::string, std::string>& headers,
                                     const std::string& payloadHash, const std::string& canonicalQuery = "");

// Header block -> lowercase name/value map; later duplicates win.
std::map<std::string, std::string> parseResponseHeaders(const std::string& hdr);

// <Error><Code>...</Code></Error> from an S3-style error document.
std::optional<std::string> parseS3ErrorCode(const std::string& body);
std::optional<std::string> parseUploadId(const std::string& body);
std::optional<std::string> parseCompleteMultipartETag(const std::string& body);

// Maps a failed S3 reply onto an ErrorKind, preferring the error code over the status.
transfer::model::ErrorKind classifyS3Error(long httpStatus, const std::string& body);

void trimInPlace(std::string& s);

void ensureCurlGlobalInit();

inline std::string slurp(const std::istream& in) {
    std::ostringstream oss;
    oss << in.rdbuf();          // copy entire buffer
    return oss.str();
}

}
