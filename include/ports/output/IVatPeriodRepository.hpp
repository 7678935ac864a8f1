#pragma once

#include "domain/VatPeriodResult.hpp"
#include "domain/PeriodKey.hpp"
#include "domain/PeriodFilter.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace vat::ports::output {

/**
 * @brief Хранилище записей VatPeriodResult
 */
class IVatPeriodRepository {
public:
    virtual ~IVatPeriodRepository() = default;

    virtual std::optional<domain::VatPeriodResult> findById(int64_t id) = 0;

    virtual std::optional<domain::VatPeriodResult> findByKey(const domain::PeriodKey& key) = 0;

    /**
     * @brief Все заблокированные периоды клиента (для переноса кредита)
     */
    virtual std::vector<domain::VatPeriodResult> findLockedByClient(const std::string& clientId) = 0;

    /**
     * @brief Периоды по фильтру, сортировка: год desc, период desc
     */
    virtual std::vector<domain::VatPeriodResult> findAll(const domain::PeriodFilter& filter) = 0;

    /**
     * @brief Вставить новую запись, вернуть её с присвоенным id
     * @throws ConcurrentModificationError если запись с таким ключом уже есть
     */
    virtual domain::VatPeriodResult insert(const domain::VatPeriodResult& period) = 0;

    /**
     * @brief Перезаписать запись целиком, если её версия не изменилась
     *
     * Запись проходит только при совпадении period.version с версией
     * в хранилище. Возвращает сохранённую запись с новой версией.
     *
     * @throws NotFoundError если записи нет
     * @throws ConcurrentModificationError если запись уже изменена другим писателем
     */
    virtual domain::VatPeriodResult update(const domain::VatPeriodResult& period) = 0;
};

} // namespace vat::ports::output
