#pragma once

#include <cstdlib>
#include <string>

namespace vat::settings {

/**
 * @brief Выбор хранилища периодов
 *
 * VAT_STORAGE: "postgres" (default) | "memory"
 */
class StorageSettings {
public:
    StorageSettings() {
        if (const char* val = std::getenv("VAT_STORAGE")) {
            backend_ = val;
        }
    }

    const std::string& getBackend() const { return backend_; }

    bool useInMemory() const { return backend_ == "memory"; }

private:
    std::string backend_ = "postgres";
};

} // namespace vat::settings
