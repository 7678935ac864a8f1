#pragma once

#include <cstdlib>
#include <string>

namespace vat::settings {

/**
 * @brief Адрес реестра клиентов (CLIENT_REGISTRY_HOST / CLIENT_REGISTRY_PORT)
 */
class ClientRegistrySettings {
public:
    ClientRegistrySettings() {
        if (const char* val = std::getenv("CLIENT_REGISTRY_HOST")) {
            host_ = val;
        }
        if (const char* val = std::getenv("CLIENT_REGISTRY_PORT")) {
            port_ = std::stoi(val);
        }
    }

    std::string getHost() const { return host_; }
    int getPort() const { return port_; }

private:
    std::string host_ = "client-registry";
    int port_ = 8081;
};

} // namespace vat::settings
