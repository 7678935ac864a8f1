#pragma once

#include <cstdlib>
#include <string>

namespace vat::settings {

/**
 * @brief Настройки кэширования
 *
 * Читает из ENV:
 * - CACHE_CLIENT_SIZE (default: 1000)
 * - CACHE_CLIENT_TTL_SECONDS (default: 300)
 */
class CacheSettings {
public:
    CacheSettings() {
        if (const char* val = std::getenv("CACHE_CLIENT_SIZE")) {
            clientCacheSize_ = static_cast<size_t>(std::stoi(val));
        }
        if (const char* val = std::getenv("CACHE_CLIENT_TTL_SECONDS")) {
            clientTtlSeconds_ = std::stoi(val);
        }
    }

    size_t getClientCacheSize() const { return clientCacheSize_; }
    int getClientTtlSeconds() const { return clientTtlSeconds_; }

private:
    size_t clientCacheSize_ = 1000;
    int clientTtlSeconds_ = 300;
};

} // namespace vat::settings
