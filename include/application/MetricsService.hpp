#pragma once

#include "ports/input/IMetricsService.hpp"
#include "settings/IMetricsSettings.hpp"

#include <atomic>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <sstream>
#include <string>

namespace vat::application {

/**
 * @brief Сервис сбора и хранения счётчиков
 *
 * - shared_mutex: поиск ключа под shared_lock, вставка под unique_lock
 * - атомарные счётчики: инкремент существующего ключа без exclusive lock
 * - ключи из getInitialKeys() публикуются с нуля, остальные появляются
 *   при первом инкременте
 */
class MetricsService : public ports::input::IMetricsService {
public:
    explicit MetricsService(std::shared_ptr<settings::IMetricsSettings> settings)
        : settings_(std::move(settings))
    {
        for (const auto& key : settings_->getInitialKeys()) {
            counters_[key] = std::make_unique<std::atomic<int64_t>>(0);
        }

        std::cout << "[MetricsService] Initialized with "
                  << counters_.size() << " metrics" << std::endl;
    }

    void increment(
        const std::string& name,
        const std::map<std::string, std::string>& labels = {}
    ) override {
        std::string key = buildKey(name, labels);

        // Fast path: ключ уже существует
        {
            std::shared_lock<std::shared_mutex> lock(mutex_);
            auto it = counters_.find(key);
            if (it != counters_.end()) {
                it->second->fetch_add(1, std::memory_order_relaxed);
                return;
            }
        }

        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = counters_.find(key);
        if (it != counters_.end()) {
            it->second->fetch_add(1, std::memory_order_relaxed);
        } else {
            counters_[key] = std::make_unique<std::atomic<int64_t>>(1);
        }
    }

    std::string toPrometheusFormat() const override {
        std::ostringstream oss;

        for (const auto& def : settings_->getDefinitions()) {
            oss << "# HELP " << def.name << " " << def.help << "\n";
            oss << "# TYPE " << def.name << " " << def.type << "\n";
        }

        std::shared_lock<std::shared_mutex> lock(mutex_);
        for (const auto& [key, value] : counters_) {
            oss << key << " " << value->load(std::memory_order_relaxed) << "\n";
        }

        return oss.str();
    }

private:
    std::shared_ptr<settings::IMetricsSettings> settings_;
    mutable std::shared_mutex mutex_;
    std::map<std::string, std::unique_ptr<std::atomic<int64_t>>> counters_;

    static std::string buildKey(
        const std::string& name,
        const std::map<std::string, std::string>& labels
    ) {
        if (labels.empty()) {
            return name;
        }

        std::ostringstream oss;
        oss << name << "{";
        bool first = true;
        for (const auto& [k, v] : labels) {
            if (!first) oss << ",";
            oss << k << "=\"" << v << "\"";
            first = false;
        }
        oss << "}";
        return oss.str();
    }
};

} // namespace vat::application
