#include "transfer/model/Locator.hpp"
#include "transfer/model/Error.hpp"

#include <algorithm>
#include <cctype>
#include <regex>
#include <fmt/core.h>

using namespace pt::transfer;
using namespace pt::transfer::model;

namespace {

std::string lower(std::string s) {
    std::ranges::transform(s, s.begin(), [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::optional<uint16_t> parsePort(const std::string& raw, const std::string& digits) {
    if (digits.empty() || !std::ranges::all_of(digits, [](const unsigned char c) { return std::isdigit(c); }))
        throw TransferError(ErrorKind::SchemeMismatch, fmt::format("Invalid port in locator '{}'", raw));
    if (digits.size() > 5)
        throw TransferError(ErrorKind::SchemeMismatch, fmt::format("Port out of range in locator '{}'", raw));
    const auto value = std::stoul(digits);
    if (value == 0 || value > 65535)
        throw TransferError(ErrorKind::SchemeMismatch, fmt::format("Port out of range in locator '{}'", raw));
    return static_cast<uint16_t>(value);
}

void splitAuthority(Locator& loc, const std::string& authority) {
    std::string hostPort = authority;
    if (const auto at = authority.rfind('@'); at != std::string::npos) {
        loc.user = authority.substr(0, at);
        hostPort = authority.substr(at + 1);
    }

    // bracketed IPv6 literals keep their colons
    if (!hostPort.empty() && hostPort.front() == '[') {
        const auto close = hostPort.find(']');
        if (close == std::string::npos)
            throw TransferError(ErrorKind::SchemeMismatch, fmt::format("Unterminated IPv6 host in locator '{}'", loc.raw));
        loc.host = hostPort.substr(0, close + 1);
        if (close + 1 < hostPort.size()) {
            if (hostPort[close + 1] != ':')
                throw TransferError(ErrorKind::SchemeMismatch, fmt::format("Malformed host in locator '{}'", loc.raw));
            loc.port = parsePort(loc.raw, hostPort.substr(close + 2));
        }
        return;
    }

    if (const auto colon = hostPort.rfind(':'); colon != std::string::npos) {
        loc.host = hostPort.substr(0, colon);
        loc.port = parsePort(loc.raw, hostPort.substr(colon + 1));
    } else loc.host = hostPort;
}

}

Locator Locator::parse(const std::string& str) {
    if (str.empty()) throw TransferError(ErrorKind::PathUnresolved, "Empty locator");

    Locator loc;
    loc.raw = str;

    if (const auto sep = str.find("://"); sep != std::string::npos) {
        static const std::regex re_scheme("^[A-Za-z][A-Za-z0-9+.-]*$");
        const auto scheme = str.substr(0, sep);
        if (!std::regex_match(scheme, re_scheme))
            throw TransferError(ErrorKind::SchemeMismatch, fmt::format("Invalid scheme in locator '{}'", str));

        loc.scheme = lower(scheme);
        const auto rest = str.substr(sep + 3);
        const auto slash = rest.find('/');
        splitAuthority(loc, rest.substr(0, slash));
        loc.path = slash == std::string::npos ? "/" : rest.substr(slash);

        if (loc.isLocal() && !loc.host.empty() && loc.host != "localhost")
            throw TransferError(ErrorKind::SchemeMismatch, fmt::format("file:// locator names a remote host: '{}'", str));
        return loc;
    }

    // [user@]host:/path (scp-style); a leading '/' or '.' always means a local path
    static const std::regex re_scp(R"(^(([^@/:]+)@)?([^@/:]+):(.*)$)");
    std::smatch m;
    if (str.front() != '/' && str.front() != '.' && std::regex_match(str, m, re_scp)) {
        loc.scheme = "ssh";
        loc.user = m[2].str();
        loc.host = m[3].str();
        loc.path = m[4].str();
        if (loc.path.empty()) loc.path = ".";
        return loc;
    }

    loc.scheme = "file";
    loc.path = str;
    return loc;
}

std::string Locator::key() const {
    if (!path.empty() && path.front() == '/') return path.substr(1);
    return path;
}

std::string Locator::basename() const {
    auto trimmed = path;
    while (trimmed.size() > 1 && trimmed.back() == '/') trimmed.pop_back();
    const auto slash = trimmed.rfind('/');
    return slash == std::string::npos ? trimmed : trimmed.substr(slash + 1);
}

std::string Locator::authority() const {
    std::string out;
    if (!user.empty()) out += user + "@";
    out += host;
    if (port) out += ":" + std::to_string(*port);
    return out;
}
