#pragma once

#include "ports/output/IVatPeriodRepository.hpp"
#include "domain/errors/VatErrors.hpp"
#include <algorithm>
#include <map>
#include <mutex>
#include <unordered_map>

namespace vat::adapters::secondary {

/**
 * @brief In-memory реализация репозитория периодов (VAT_STORAGE=memory, тесты)
 */
class InMemoryVatPeriodRepository : public ports::output::IVatPeriodRepository {
public:
    std::optional<domain::VatPeriodResult> findById(int64_t id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = periods_.find(id);
        if (it == periods_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    std::optional<domain::VatPeriodResult> findByKey(const domain::PeriodKey& key) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto idIt = keyIndex_.find(key.toString());
        if (idIt == keyIndex_.end()) {
            return std::nullopt;
        }
        return periods_.at(idIt->second);
    }

    std::vector<domain::VatPeriodResult> findLockedByClient(const std::string& clientId) override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<domain::VatPeriodResult> result;
        for (const auto& [id, period] : periods_) {
            if (period.isLocked && period.key.clientId() == clientId) {
                result.push_back(period);
            }
        }
        return result;
    }

    std::vector<domain::VatPeriodResult> findAll(const domain::PeriodFilter& filter) override {
        std::vector<domain::VatPeriodResult> result;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (const auto& [id, period] : periods_) {
                if (filter.clientId && period.key.clientId() != *filter.clientId) continue;
                if (filter.periodType && period.key.type() != *filter.periodType) continue;
                if (filter.year && period.key.year() != *filter.year) continue;
                result.push_back(period);
            }
        }

        // Год desc, период desc; id для стабильного порядка
        std::sort(result.begin(), result.end(),
            [](const domain::VatPeriodResult& a, const domain::VatPeriodResult& b) {
                if (a.key.year() != b.key.year()) return a.key.year() > b.key.year();
                if (a.key.period() != b.key.period()) return a.key.period() > b.key.period();
                return a.id < b.id;
            });

        return result;
    }

    domain::VatPeriodResult insert(const domain::VatPeriodResult& period) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto keyStr = period.key.toString();
        if (keyIndex_.count(keyStr) > 0) {
            throw domain::ConcurrentModificationError("Period " + keyStr + " already exists");
        }

        domain::VatPeriodResult stored = period;
        stored.id = nextId_++;
        stored.version = 0;
        periods_.emplace(stored.id, stored);
        keyIndex_[keyStr] = stored.id;
        return stored;
    }

    domain::VatPeriodResult update(const domain::VatPeriodResult& period) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = periods_.find(period.id);
        if (it == periods_.end()) {
            throw domain::NotFoundError("VAT period " + std::to_string(period.id) + " not found");
        }
        if (it->second.version != period.version) {
            throw domain::ConcurrentModificationError(
                "Period " + period.key.toString() + " was modified concurrently");
        }

        it->second = period;
        ++it->second.version;
        return it->second;
    }

    size_t count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return periods_.size();
    }

private:
    mutable std::mutex mutex_;
    std::map<int64_t, domain::VatPeriodResult> periods_;
    std::unordered_map<std::string, int64_t> keyIndex_;  // PeriodKey::toString() -> id
    int64_t nextId_ = 1;
};

} // namespace vat::adapters::secondary
