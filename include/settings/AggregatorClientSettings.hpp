#pragma once

#include "settings/IAggregatorClientSettings.hpp"
#include <cstdlib>
#include <string>

namespace vat::settings {

class AggregatorClientSettings : public IAggregatorClientSettings {
public:
    std::string getHost() const override {
        const char* host = std::getenv("VAT_AGGREGATOR_HOST");
        return host ? host : "localhost";
    }

    int getPort() const override {
        const char* port = std::getenv("VAT_AGGREGATOR_PORT");
        return port ? std::stoi(port) : 8085;
    }

    int getTimeoutMs() const override {
        const char* timeout = std::getenv("VAT_AGGREGATOR_TIMEOUT_MS");
        return timeout ? std::stoi(timeout) : 5000;
    }

    int getMaxInFlight() const override {
        const char* limit = std::getenv("VAT_AGGREGATOR_MAX_IN_FLIGHT");
        return limit ? std::stoi(limit) : 32;
    }
};

} // namespace vat::settings
