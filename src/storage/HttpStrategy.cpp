#include "storage/HttpStrategy.hpp"
#include "transfer/model/Error.hpp"
#include "util/curlWrappers.hpp"
#include "util/files.hpp"
#include "log/Registry.hpp"

#include <fstream>
#include <fmt/core.h>

using namespace pt::storage;
using namespace pt::transfer;
using namespace pt::transfer::model;
using namespace pt::util;
using namespace pt::log;

namespace {

struct FileSink {
    CURL* handle = nullptr;
    std::ofstream* out = nullptr;
    std::string errorBody;
};

size_t writeFileSink(const char* ptr, const size_t size, const size_t nmemb, void* userdata) {
    auto* sink = static_cast<FileSink*>(userdata);
    long status = 0;
    curl_easy_getinfo(sink->handle, CURLINFO_RESPONSE_CODE, &status);
    if (status / 100 != 2) {
        sink->errorBody.append(ptr, size * nmemb);
        return size * nmemb;
    }
    sink->out->write(ptr, static_cast<std::streamsize>(size * nmemb));
    return sink->out->good() ? size * nmemb : 0;
}

[[noreturn]] void raise(const std::string& op, const Locator& loc, const HttpResponse& resp) {
    const auto kind = resp.curl != CURLE_OK ? classifyCurl(resp.curl) : classifyHttpStatus(resp.http);
    const auto detail = resp.curl != CURLE_OK ? std::string(curl_easy_strerror(resp.curl))
                                              : fmt::format("HTTP {}", resp.http);
    Registry::http()->error("[HttpStrategy] {} {} failed: {}", op, loc.str(), detail);
    throw TransferError(kind, fmt::format("{} {}: {}", op, loc.str(), detail));
}

}

HttpStrategy::HttpStrategy(config::StrategyConfig cfg)
    : Strategy(std::move(cfg)),
      transport_([] {
          ensureCurlGlobalInit();
          const auto* info = curl_version_info(CURLVERSION_NOW);
          return std::make_shared<Transport>(Transport{info && (info->features & CURL_VERSION_SSL) != 0});
      }) {}

std::vector<std::string> HttpStrategy::schemes() const {
    if (!config_.scheme.empty()) return {config_.scheme};
    return {"http", "https"};
}

void HttpStrategy::checkLocator(const Locator& loc) const {
    if (loc.host.empty())
        throw TransferError(ErrorKind::SchemeMismatch, fmt::format("HTTP locator has no host: '{}'", loc.str()));
}

void HttpStrategy::download(const Locator& remote, const fs::path& local, const Context& ctx) const {
    ctx.checkpoint();
    if (remote.scheme == "https" && !transport_.get()->tls)
        throw TransferError(ErrorKind::UnsupportedOperation, "libcurl was built without TLS support");

    StagingFile staged(local);
    std::ofstream out(staged.path(), std::ios::binary | std::ios::trunc);
    if (!out) throw TransferError(ErrorKind::LocalIOFailure,
                                  fmt::format("Failed to open '{}' for writing", staged.path().string()));

    FileSink sink;
    sink.out = &out;

    HttpResponse resp = performCurl(ctx, [&](CURL* h) {
        sink.handle = h;
        curl_easy_setopt(h, CURLOPT_URL, remote.str().c_str());
        curl_easy_setopt(h, CURLOPT_HTTPGET, 1L);
        curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, writeFileSink);
        curl_easy_setopt(h, CURLOPT_WRITEDATA, &sink);
        if (!config_.verify_tls) {
            curl_easy_setopt(h, CURLOPT_SSL_VERIFYPEER, 0L);
            curl_easy_setopt(h, CURLOPT_SSL_VERIFYHOST, 0L);
        }
    });

    out.close();
    if (!resp.ok()) raise("GET", remote, resp);
    if (!out) throw TransferError(ErrorKind::LocalIOFailure, fmt::format("Failed to flush '{}'", local.string()));

    const auto written = fs::file_size(staged.path());
    if (!completeBody(resp.contentLength, written))
        throw TransferError(ErrorKind::TransportFailure,
                            fmt::format("Short read from '{}': got {} of {} bytes", remote.str(), written, resp.contentLength));

    staged.commit();
    Registry::http()->info("[HttpStrategy] {} -> {} ({} bytes)", remote.str(), local.string(), written);
}

void HttpStrategy::upload(const fs::path& local, const Locator& remote, const Context& ctx) const {
    if (!canUpload())
        throw TransferError(ErrorKind::UnsupportedOperation, fmt::format("Strategy '{}' is read-only", name()));
    ctx.checkpoint();
    transport_.get();

    std::error_code ec;
    if (!fs::is_regular_file(local, ec))
        throw TransferError(ErrorKind::LocalIOFailure, fmt::format("Upload source '{}' does not exist", local.string()));

    std::ifstream fin(local, std::ios::binary);
    if (!fin) throw TransferError(ErrorKind::LocalIOFailure, fmt::format("Failed to open '{}' for reading", local.string()));
    const auto size = static_cast<curl_off_t>(fs::file_size(local));

    SList hdrs;
    hdrs.add("Content-Type: application/octet-stream");

    const HttpResponse resp = performCurl(ctx, [&](CURL* h) {
        curl_easy_setopt(h, CURLOPT_URL, remote.str().c_str());
        curl_easy_setopt(h, CURLOPT_UPLOAD, 1L);
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, hdrs.get());
        curl_easy_setopt(h, CURLOPT_READDATA, &fin);
        curl_easy_setopt(h, CURLOPT_INFILESIZE_LARGE, size);
        curl_easy_setopt(h, CURLOPT_READFUNCTION,
            +[](char* buf, const size_t sz, const size_t nm, void* ud) -> size_t {
                auto* fp = static_cast<std::ifstream*>(ud);
                fp->read(buf, static_cast<std::streamsize>(sz * nm));
                if (fp->bad()) return CURL_READFUNC_ABORT;
                return static_cast<size_t>(fp->gcount());
            });
        if (!config_.verify_tls) {
            curl_easy_setopt(h, CURLOPT_SSL_VERIFYPEER, 0L);
            curl_easy_setopt(h, CURLOPT_SSL_VERIFYHOST, 0L);
        }
    });

    if (!resp.ok()) raise("PUT", remote, resp);
    Registry::http()->info("[HttpStrategy] {} -> {} (HTTP {})", local.string(), remote.str(), resp.http);
}
