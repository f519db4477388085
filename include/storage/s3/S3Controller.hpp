#pragma once

#include "storage/CredentialResolver.hpp"
#include "util/curlWrappers.hpp"

#include <filesystem>
#include <map>
#include <optional>
#include <ostream>
#include <string>
#include <vector>
#include <curl/curl.h>

namespace pt::transfer { struct Context; }

namespace pt::cloud {

namespace fs = std::filesystem;

struct ObjectHead {
    uintmax_t size = 0;
    std::string etag;
    std::map<std::string, std::string> headers;
};

// Path-style S3 REST client for one bucket, signed with SigV4. Works against
// AWS, S3-compatible endpoints and the GCS XML API with HMAC keys. Every call
// honors the context's deadline and interrupt flag and throws
// transfer::TransferError on failure.
class S3Controller {
public:
    static constexpr uintmax_t MIN_PART_SIZE = 5 * 1024 * 1024; // 5 MiB

    S3Controller(storage::ObjectStoreCredentials creds, std::string bucket);

    // #########################################################################
    // ########################### FILE OPS ####################################
    // #########################################################################

    // Both return the ETag the store acknowledged the object with.
    std::string uploadObject(const fs::path& key, const fs::path& filePath, const transfer::Context& ctx) const;
    std::string uploadLargeObject(const fs::path& key, const fs::path& filePath, uintmax_t partSize,
                                  const transfer::Context& ctx) const;

    void downloadObject(const fs::path& key, std::ostream& out, const transfer::Context& ctx) const;

    // Inclusive byte range [first, last].
    void downloadRange(const fs::path& key, std::ostream& out, uintmax_t first, uintmax_t last,
                       const transfer::Context& ctx) const;

    // #########################################################################
    // ######################## MULTIPART UPLOADS ##############################
    // #########################################################################

    [[nodiscard]] std::string initiateMultipartUpload(const fs::path& key, const transfer::Context& ctx) const;

    [[nodiscard]] std::string uploadPart(const fs::path& key, const std::string& uploadId, int partNumber,
                                         const std::string& partData, const transfer::Context& ctx) const;

    std::string completeMultipartUpload(const fs::path& key, const std::string& uploadId,
                                        const std::vector<std::string>& etags, const transfer::Context& ctx) const;

    void abortMultipartUpload(const fs::path& key, const std::string& uploadId, const transfer::Context& ctx) const;

    // #########################################################################
    // ######################## METADATA #######################################
    // #########################################################################

    // nullopt when the object does not exist; other failures throw.
    [[nodiscard]] std::optional<ObjectHead> headObject(const fs::path& key, const transfer::Context& ctx) const;

    [[nodiscard]] const std::string& bucket() const { return bucket_; }

private:
    storage::ObjectStoreCredentials creds_;
    util::SigV4Credentials signing_;
    std::string bucket_;

    [[nodiscard]] std::map<std::string, std::string> buildHeaderMap(const std::string& payloadHash) const;

    std::pair<std::string, std::string> constructPaths(CURL* curl, const fs::path& p,
                                                       const std::string& query = "") const;

    [[nodiscard]] util::SList makeSigHeaders(const std::string& method,
                                             const std::string& canonical,
                                             const std::string& payloadHash) const;

    void streamGet(const fs::path& key, std::ostream& out, const std::optional<std::string>& range,
                   const transfer::Context& ctx) const;

    [[noreturn]] void fail(const std::string& op, const fs::path& key, const util::HttpResponse& resp) const;
};

}
