#pragma once

#include "domain/JournalEntry.hpp"
#include <cstdint>

namespace reconciliation::ports::output {

/**
 * @brief Создание и проведение проводки во внешнем журнале
 *
 * Односторонний вызов: сервис сверки не читает внутренности журнала.
 * Проведение по банковскому счёту GL порождает системную банковскую операцию.
 */
class IJournalEntryFactory {
public:
    virtual ~IJournalEntryFactory() = default;

    /**
     * @return ID созданной проводки
     * @throws domain::PersistenceError при сбое журнала
     */
    virtual int64_t createAndPost(const domain::JournalEntryRequest& request) = 0;
};

} // namespace reconciliation::ports::output
