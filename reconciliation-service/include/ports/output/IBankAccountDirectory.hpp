#pragma once

#include "domain/BankAccount.hpp"
#include <optional>
#include <cstdint>

namespace reconciliation::ports::output {

/**
 * @brief Справочник банковских счетов
 */
class IBankAccountDirectory {
public:
    virtual ~IBankAccountDirectory() = default;

    virtual std::optional<domain::BankAccount> getById(int64_t bankAccountId) = 0;
};

} // namespace reconciliation::ports::output
