#include "util/s3Helpers.hpp"
#include "util/curlWrappers.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <openssl/hmac.h>
#include <openssl/sha.h>
#include <pugixml.hpp>

namespace pt::util {

using transfer::model::ErrorKind;

void ensureCurlGlobalInit() {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

std::string sha256Hex(const std::string& data) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), hash);
    std::ostringstream oss;
    for (const unsigned char c : hash) oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(c);
    return oss.str();
}

std::string hmacSha256Raw(const std::string& key, const std::string& data) {
    unsigned char digest[SHA256_DIGEST_LENGTH];
    HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
         reinterpret_cast<const unsigned char*>(data.data()), data.size(), digest, nullptr);
    return {reinterpret_cast<char*>(digest), SHA256_DIGEST_LENGTH};
}

std::string hmacSha256HexFromRaw(const std::string& rawKey, const std::string& data) {
    const auto sig = hmacSha256Raw(rawKey, data);
    std::ostringstream oss;
    for (const unsigned char i : sig) oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(i);
    return oss.str();
}

std::string escapeKeyPreserveSlashes(CURL* curl, const std::filesystem::path& p) {
    std::ostringstream out;
    bool first = true;
    for (const auto& part : p) {
        const std::string seg = part.string();
        if (seg.empty() || seg == "/") continue;
        if (!first) out << '/';
        first = false;

        char* esc = curl_easy_escape(curl, seg.c_str(), static_cast<int>(seg.length()));
        if (!esc) throw std::runtime_error("escape failed for key segment: " + seg);
        out << esc;
        curl_free(esc);
    }
    return out.str();
}

std::string composeMultiPartUploadXMLBody(const std::vector<std::string>& etags) {
    std::ostringstream xml;

    xml << "<CompleteMultipartUpload>";

    for (size_t i = 0; i < etags.size(); ++i)
        xml << "<Part><PartNumber>" << (i + 1) << "</PartNumber><ETag>" << etags[i] << "</ETag></Part>";

    xml << "</CompleteMultipartUpload>";

    return xml.str();
}

size_t writeToString(const char* ptr, const size_t size, const size_t nmemb, void* userdata) {
    auto* out = static_cast<std::string*>(userdata);
    out->append(ptr, size * nmemb);
    return size * nmemb;
}

bool extractETag(const std::string& respHdr, std::string& etagOut) {
    const auto headers = parseResponseHeaders(respHdr);
    const auto it = headers.find("etag");
    if (it == headers.end()) return false;
    etagOut = it->second;
    return !etagOut.empty();
}

std::string buildAuthorizationHeader(const SigV4Credentials& creds,
                                     const std::string& method,
                                     const std::string& fullPath,
                                     const std::map<std::string, std::string>& headers,
                                     const std::string& payloadHash,
                                     const std::string& canonicalQuery /* = "" */) {
    std::string canonicalPath;
    std::string effectiveQuery;

    // Parse fullPath only if canonicalQuery is not explicitly given
    if (canonicalQuery.empty()) {
        const auto qpos = fullPath.find('?');
        if (qpos == std::string::npos) {
            canonicalPath = fullPath;
        } else {
            canonicalPath = fullPath.substr(0, qpos);
            effectiveQuery = fullPath.substr(qpos + 1);
            if (effectiveQuery.find('=') == std::string::npos)
                effectiveQuery += "=";  // handle case like ?uploads
        }
    } else {
        canonicalPath = fullPath;
        effectiveQuery = canonicalQuery;
    }

    const std::string service = "s3";
    const std::string algorithm = "AWS4-HMAC-SHA256";
    const std::string amzDate = headers.at("x-amz-date");
    const std::string dateStamp = amzDate.substr(0, 8); // YYYYMMDD

    // Build canonical headers and signed headers
    std::string canonicalHeaders, signedHeaders;
    for (auto it = headers.begin(); it != headers.end(); ++it) {
        canonicalHeaders += it->first + ":" + it->second + "\n";
        signedHeaders += it->first;
        if (std::next(it) != headers.end())
            signedHeaders += ";";
    }

    std::ostringstream canonicalRequestStream;
    canonicalRequestStream << method << "\n"
                           << canonicalPath << "\n"
                           << effectiveQuery << "\n"
                           << canonicalHeaders << "\n"
                           << signedHeaders << "\n"
                           << payloadHash;
    const std::string hashedCanonicalRequest = sha256Hex(canonicalRequestStream.str());

    const std::string credentialScope = dateStamp + "/" + creds.region + "/" + service + "/aws4_request";
    std::ostringstream stringToSignStream;
    stringToSignStream << algorithm << "\n"
                       << amzDate << "\n"
                       << credentialScope << "\n"
                       << hashedCanonicalRequest;

    const std::string kDate    = hmacSha256Raw("AWS4" + creds.secret_access_key, dateStamp);
    const std::string kRegion  = hmacSha256Raw(kDate, creds.region);
    const std::string kService = hmacSha256Raw(kRegion, service);
    const std::string kSigning = hmacSha256Raw(kService, "aws4_request");

    const std::string signature = hmacSha256HexFromRaw(kSigning, stringToSignStream.str());

    std::ostringstream authHeader;
    authHeader << algorithm << " "
               << "Credential=" << creds.access_key << "/" << credentialScope << ", "
               << "SignedHeaders=" << signedHeaders << ", "
               << "Signature=" << signature;

    return authHeader.str();
}

std::map<std::string, std::string> parseResponseHeaders(const std::string& hdr) {
    std::map<std::string, std::string> out;
    std::istringstream headerStream(hdr);
    std::string line;
    while (std::getline(headerStream, line)) {
        // redirects and 100-continue prepend whole blocks; keep the final response only
        if (line.starts_with("HTTP/")) {
            out.clear();
            continue;
        }
        const auto pos = line.find(':');
        if (pos == std::string::npos) continue;
        std::string key = line.substr(0, pos);
        std::string value = line.substr(pos + 1);
        trimInPlace(key);
        trimInPlace(value);
        std::ranges::transform(key, key.begin(), [](const unsigned char c) { return std::tolower(c); });
        out[std::move(key)] = std::move(value);
    }
    return out;
}

static std::optional<std::string> childText(const std::string& body, const char* root, const char* child) {
    if (body.empty()) return std::nullopt;
    pugi::xml_document doc;
    if (!doc.load_string(body.c_str())) return std::nullopt;
    const auto node = doc.child(root).child(child);
    if (!node) return std::nullopt;
    std::string text = node.text().as_string();
    if (text.empty()) return std::nullopt;
    return text;
}

std::optional<std::string> parseS3ErrorCode(const std::string& body) {
    return childText(body, "Error", "Code");
}

std::optional<std::string> parseUploadId(const std::string& body) {
    return childText(body, "InitiateMultipartUploadResult", "UploadId");
}

std::optional<std::string> parseCompleteMultipartETag(const std::string& body) {
    return childText(body, "CompleteMultipartUploadResult", "ETag");
}

ErrorKind classifyS3Error(const long httpStatus, const std::string& body) {
    if (const auto code = parseS3ErrorCode(body)) {
        if (*code == "NoSuchKey" || *code == "NoSuchBucket" || *code == "NoSuchUpload")
            return ErrorKind::ObjectNotFound;
        if (*code == "AccessDenied" || *code == "SignatureDoesNotMatch" || *code == "InvalidAccessKeyId" ||
            *code == "ExpiredToken" || *code == "InvalidToken" || *code == "AuthorizationHeaderMalformed")
            return ErrorKind::AuthenticationFailure;
        if (*code == "RequestTimeout")
            return ErrorKind::NetworkTimeout;
    }
    return classifyHttpStatus(httpStatus);
}

void trimInPlace(std::string& s) {
    s.erase(s.begin(), std::ranges::find_if(s.begin(), s.end(), [](const unsigned char ch) {
        return !std::isspace(ch);
    }));

    s.erase(std::find_if(s.rbegin(), s.rend(), [](const unsigned char ch) {
        return !std::isspace(ch);
    }).base(), s.end());
}

}
