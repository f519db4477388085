#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace pt::transfer::model {

// Address of one side of a transfer.
//
//   scheme://[user@]host[:port]/path   scheme-qualified remote (s3, gs, http(s), ssh, file, ...)
//   [user@]host:/path                  scp-style remote host, scheme "ssh"
//   /abs/path, rel/path                local filesystem, scheme "file"
struct Locator {
    std::string raw;
    std::string scheme;
    std::string user;
    std::string host;
    std::optional<uint16_t> port;
    std::string path;

    Locator() = default;

    // Throws TransferError(SchemeMismatch) on malformed input.
    static Locator parse(const std::string& str);

    [[nodiscard]] bool isLocal() const { return scheme == "file"; }
    [[nodiscard]] bool isRemote() const { return !isLocal(); }
    [[nodiscard]] bool isAbsolute() const { return !path.empty() && path.front() == '/'; }

    // Object-store view: host is the bucket, path minus its leading '/' is the key.
    [[nodiscard]] const std::string& bucket() const { return host; }
    [[nodiscard]] std::string key() const;

    [[nodiscard]] std::filesystem::path localPath() const { return path; }

    // Last path component, used to name temp destinations.
    [[nodiscard]] std::string basename() const;

    // user@host[:port] with whichever parts are present
    [[nodiscard]] std::string authority() const;

    [[nodiscard]] const std::string& str() const { return raw; }

    friend bool operator==(const Locator& a, const Locator& b) { return a.raw == b.raw; }
};

}
