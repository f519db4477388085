#pragma once

#include "config/Config.hpp"

#include <optional>
#include <string>

namespace pt::storage {

struct ObjectStoreCredentials {
    std::string access_key;
    std::string secret_access_key;
    std::string region;
    std::string endpoint;
};

// Ambient lookup for settings a strategy record leaves unset.
class CredentialResolver {
public:
    virtual ~CredentialResolver() = default;
    [[nodiscard]] virtual std::optional<std::string> lookup(const std::string& name) const = 0;
};

class EnvCredentialResolver final : public CredentialResolver {
public:
    [[nodiscard]] std::optional<std::string> lookup(const std::string& name) const override;
};

// Explicit fields first, then `credentials_path` (a YAML file with the same
// keys), then the resolver: AWS_* for s3, GCS_HMAC_* for gs. Missing key or
// secret throws TransferError(AuthenticationFailure).
ObjectStoreCredentials resolveObjectStoreCredentials(const config::StrategyConfig& cfg,
                                                     const std::string& scheme,
                                                     const CredentialResolver& resolver);

std::string defaultEndpoint(const std::string& scheme, const std::string& region);

}
