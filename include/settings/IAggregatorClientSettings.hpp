#pragma once

#include <string>

namespace vat::settings {

class IAggregatorClientSettings {
public:
    virtual ~IAggregatorClientSettings() = default;

    virtual std::string getHost() const = 0;
    virtual int getPort() const = 0;
    virtual int getTimeoutMs() const = 0;

    /**
     * @brief Предел одновременных запросов, включая зависшие после таймаута
     */
    virtual int getMaxInFlight() const = 0;
};

} // namespace vat::settings
