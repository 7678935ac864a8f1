#pragma once

#include "ports/output/IClientRegistry.hpp"
#include "adapters/secondary/HttpClientRegistry.hpp"
#include "settings/CacheSettings.hpp"
#include <cache/ICache.hpp>
#include <cache/Cache.hpp>
#include <cache/eviction/LRUPolicy.hpp>
#include <cache/expiration/GlobalTTL.hpp>
#include <cache/concurrency/ThreadSafeCache.hpp>
#include <chrono>
#include <memory>
#include <iostream>

namespace vat::adapters::secondary {

/**
 * @brief Декоратор IClientRegistry с LRU + TTL кэшированием
 *
 * Кэшируются только найденные клиенты: неизвестный клиент
 * запрашивается повторно (мог появиться в реестре).
 */
class CachedClientRegistry : public ports::output::IClientRegistry {
public:
    CachedClientRegistry(
        std::shared_ptr<HttpClientRegistry> delegate,
        std::shared_ptr<settings::CacheSettings> cacheSettings
    ) : delegate_(std::move(delegate))
      , cacheSettings_(std::move(cacheSettings))
    {
        initCache();
    }

    std::optional<domain::ClientInfo> findClient(const std::string& clientId) override {
        auto cached = clientCache_->get(clientId);
        if (cached) {
            return *cached;
        }

        auto client = delegate_->findClient(clientId);
        if (client) {
            clientCache_->put(clientId, *client);
        }

        return client;
    }

    /**
     * @brief Поиск по ИНН всегда идёт в реестр; найденный клиент кладётся в кэш по id
     */
    std::optional<domain::ClientInfo> findClientByTaxId(const std::string& taxId) override {
        auto client = delegate_->findClientByTaxId(taxId);
        if (client) {
            clientCache_->put(client->id, *client);
        }
        return client;
    }

    void clearCache() {
        clientCache_->clear();
    }

    size_t getCacheSize() const {
        return clientCache_->size();
    }

private:
    void initCache() {
        size_t cacheSize = cacheSettings_->getClientCacheSize();
        int ttlSeconds = cacheSettings_->getClientTtlSeconds();

        auto base = std::make_unique<Cache<std::string, domain::ClientInfo>>(
            cacheSize,
            std::make_unique<LRUPolicy<std::string>>(),
            std::make_unique<GlobalTTL<std::string>>(std::chrono::seconds(ttlSeconds))
        );
        clientCache_ = std::make_unique<ThreadSafeCache<std::string, domain::ClientInfo>>(
            std::move(base)
        );

        std::cout << "[CachedClientRegistry] Created with clientCache="
                  << cacheSize << "/" << ttlSeconds << "s" << std::endl;
    }

    std::shared_ptr<HttpClientRegistry> delegate_;
    std::shared_ptr<settings::CacheSettings> cacheSettings_;
    std::unique_ptr<ICache<std::string, domain::ClientInfo>> clientCache_;
};

} // namespace vat::adapters::secondary
