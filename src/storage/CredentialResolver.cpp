#include "storage/CredentialResolver.hpp"
#include "transfer/model/Error.hpp"

#include <cstdlib>
#include <filesystem>
#include <yaml-cpp/yaml.h>
#include <fmt/core.h>

using namespace pt::storage;
using namespace pt::transfer;
using namespace pt::transfer::model;

std::optional<std::string> EnvCredentialResolver::lookup(const std::string& name) const {
    const char* v = std::getenv(name.c_str());
    if (!v || !*v) return std::nullopt;
    return std::string(v);
}

namespace {

void fillFrom(std::string& field, const std::optional<std::string>& value) {
    if (field.empty() && value) field = *value;
}

void loadCredentialsFile(const std::filesystem::path& path, ObjectStoreCredentials& out) {
    if (!std::filesystem::exists(path))
        throw TransferError(ErrorKind::AuthenticationFailure,
                            fmt::format("Credentials file '{}' does not exist", path.string()));
    try {
        const YAML::Node root = YAML::LoadFile(path.string());
        auto take = [&](std::string& field, const char* key) {
            if (field.empty() && root[key]) field = root[key].as<std::string>();
        };
        take(out.access_key, "access_key");
        take(out.secret_access_key, "secret_access_key");
        take(out.region, "region");
        take(out.endpoint, "endpoint");
    } catch (const YAML::Exception& e) {
        throw TransferError(ErrorKind::AuthenticationFailure,
                            fmt::format("Failed to read credentials file '{}': {}", path.string(), e.what()));
    }
}

}

ObjectStoreCredentials pt::storage::resolveObjectStoreCredentials(const config::StrategyConfig& cfg,
                                                                  const std::string& scheme,
                                                                  const CredentialResolver& resolver) {
    ObjectStoreCredentials creds{cfg.access_key, cfg.secret_access_key, cfg.region, cfg.endpoint};

    if (!cfg.credentials_path.empty()) loadCredentialsFile(cfg.credentials_path, creds);

    if (scheme == "gs") {
        fillFrom(creds.access_key, resolver.lookup("GCS_HMAC_ACCESS_KEY"));
        fillFrom(creds.secret_access_key, resolver.lookup("GCS_HMAC_SECRET"));
        if (creds.region.empty()) creds.region = "auto";
    } else {
        fillFrom(creds.access_key, resolver.lookup("AWS_ACCESS_KEY_ID"));
        fillFrom(creds.secret_access_key, resolver.lookup("AWS_SECRET_ACCESS_KEY"));
        fillFrom(creds.region, resolver.lookup("AWS_REGION"));
        fillFrom(creds.region, resolver.lookup("AWS_DEFAULT_REGION"));
        fillFrom(creds.endpoint, resolver.lookup("AWS_ENDPOINT_URL"));
        if (creds.region.empty()) creds.region = "us-east-1";
    }

    if (creds.endpoint.empty()) creds.endpoint = defaultEndpoint(scheme, creds.region);
    while (!creds.endpoint.empty() && creds.endpoint.back() == '/') creds.endpoint.pop_back();

    if (creds.access_key.empty() || creds.secret_access_key.empty())
        throw TransferError(ErrorKind::AuthenticationFailure,
                            fmt::format("No {} credentials configured for strategy '{}'", scheme, cfg.name));

    return creds;
}

std::string pt::storage::defaultEndpoint(const std::string& scheme, const std::string& region) {
    if (scheme == "gs") return "https://storage.googleapis.com";
    return fmt::format("https://s3.{}.amazonaws.com", region.empty() ? "us-east-1" : region);
}
