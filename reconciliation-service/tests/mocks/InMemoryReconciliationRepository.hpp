#pragma once

#include "ports/output/IReconciliationRepository.hpp"
#include "domain/ReconciliationError.hpp"
#include <map>
#include <mutex>
#include <algorithm>

namespace reconciliation::tests::mocks {

/**
 * @brief In-Memory репозиторий сверок для unit-тестов
 *
 * Повторяет контракт Postgres-адаптера: один открытый черновик
 * на (счёт, дата), условная финализация только из DRAFT.
 */
class InMemoryReconciliationRepository : public ports::output::IReconciliationRepository {
public:
    domain::Reconciliation getOrCreateDraft(
        int64_t bankAccountId,
        const domain::Date& statementDate,
        const domain::Money& statementEndingBalance,
        const std::optional<std::string>& notes,
        int64_t actorId) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        failIfBroken();

        for (auto& [id, rec] : records_) {
            if (rec.bankAccountId == bankAccountId && rec.statementDate == statementDate && rec.isDraft()) {
                rec.statementEndingBalance = statementEndingBalance;
                if (notes) rec.notes = *notes;
                return rec;
            }
        }

        domain::Reconciliation rec;
        rec.id = nextId_++;
        rec.bankAccountId = bankAccountId;
        rec.statementDate = statementDate;
        rec.statementEndingBalance = statementEndingBalance;
        rec.status = domain::ReconciliationStatus::DRAFT;
        rec.notes = notes.value_or("");
        rec.createdBy = actorId;
        rec.createdAt = domain::Timestamp::now();
        records_[rec.id] = rec;
        return rec;
    }

    std::optional<domain::Reconciliation> findById(int64_t reconciliationId) override {
        std::lock_guard<std::mutex> lock(mutex_);
        failIfBroken();
        auto it = records_.find(reconciliationId);
        if (it == records_.end()) return std::nullopt;
        return it->second;
    }

    domain::ReconciliationPage findFinalized(int64_t bankAccountId, int page, int pageSize) override {
        std::lock_guard<std::mutex> lock(mutex_);
        failIfBroken();

        std::vector<domain::Reconciliation> finalized;
        for (const auto& [id, rec] : records_) {
            if (rec.bankAccountId == bankAccountId && rec.isFinalized()) {
                finalized.push_back(rec);
            }
        }
        std::sort(finalized.begin(), finalized.end(), [](const auto& a, const auto& b) {
            if (a.statementDate != b.statementDate) return b.statementDate < a.statementDate;
            return a.id > b.id;
        });

        domain::ReconciliationPage out;
        out.totalCount = static_cast<int64_t>(finalized.size());
        size_t offset = static_cast<size_t>(page - 1) * static_cast<size_t>(pageSize);
        for (size_t i = offset; i < finalized.size() && i < offset + pageSize; ++i) {
            out.items.push_back(finalized[i]);
        }
        return out;
    }

    bool finalize(const ports::output::FinalizeCommand& command) override {
        std::lock_guard<std::mutex> lock(mutex_);
        failIfBroken();

        auto it = records_.find(command.reconciliationId);
        if (it == records_.end() || !it->second.isDraft()) {
            return false;
        }
        auto& rec = it->second;
        rec.status = domain::ReconciliationStatus::FINALIZED;
        rec.statementEndingBalance = command.statementEndingBalance;
        rec.calculatedBookBalance = command.calculatedBookBalance;
        rec.difference = command.difference;
        rec.finalizedAt = command.finalizedAt;
        ++finalizeCalls_;
        return true;
    }

    // Test helpers

    /// Финализировать в обход сервисов (конкурирующая сессия)
    void forceFinalize(int64_t reconciliationId) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& rec = records_.at(reconciliationId);
        rec.status = domain::ReconciliationStatus::FINALIZED;
        rec.calculatedBookBalance = rec.statementEndingBalance;
        rec.difference = domain::Money::zero();
        rec.finalizedAt = domain::Timestamp::now();
    }

    void setBroken(bool broken) {
        std::lock_guard<std::mutex> lock(mutex_);
        broken_ = broken;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return records_.size();
    }

    size_t countDrafts(int64_t bankAccountId, const domain::Date& statementDate) const {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t count = 0;
        for (const auto& [id, rec] : records_) {
            if (rec.bankAccountId == bankAccountId && rec.statementDate == statementDate && rec.isDraft()) {
                ++count;
            }
        }
        return count;
    }

    int finalizeCalls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return finalizeCalls_;
    }

private:
    mutable std::mutex mutex_;
    std::map<int64_t, domain::Reconciliation> records_;
    int64_t nextId_ = 1;
    bool broken_ = false;
    int finalizeCalls_ = 0;

    void failIfBroken() const {
        if (broken_) {
            throw domain::PersistenceError("connection lost");
        }
    }
};

} // namespace reconciliation::tests::mocks
