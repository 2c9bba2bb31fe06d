#include "circulation/inventory_ledger.hpp"
#include "circulation/errors.hpp"
#include <spdlog/spdlog.h>

namespace circ {

InventoryLedger::InventoryLedger(LoanStore& store) : store(store) {}

BookRecord& InventoryLedger::require(const BookId& bookId) const {
    validateId("book", bookId);
    BookRecord* rec = store.findBook(bookId);
    if (!rec) throw LoanError::notFound("book '" + bookId + "' not found");
    return *rec;
}

Book InventoryLedger::reserveCopy(const BookId& bookId) {
    auto& rec = require(bookId);
    UnitOfWork uow;
    uow.lock(rec);
    Book b = reserveCopy(uow, rec);
    uow.commit();
    return b;
}

Book InventoryLedger::releaseCopy(const BookId& bookId) {
    auto& rec = require(bookId);
    UnitOfWork uow;
    uow.lock(rec);
    Book b = releaseCopy(uow, rec);
    uow.commit();
    return b;
}

Book InventoryLedger::reserveCopy(UnitOfWork& uow, BookRecord& book) {
    auto& row = book.row;
    if (row.availableCopies <= 0) {
        spdlog::debug("inventory_ledger: book {} out of stock", row.id);
        throw LoanError::outOfStock("book '" + row.id + "' has no available copies");
    }
    if (row.availableCopies > row.totalCopies) {
        throw LoanError::invariantViolation("book " + row.id + " available=" +
            std::to_string(row.availableCopies) + " > total=" + std::to_string(row.totalCopies));
    }
    --row.availableCopies;
    uow.onRollback([&book] { ++book.row.availableCopies; });
    return row;
}

Book InventoryLedger::releaseCopy(UnitOfWork& uow, BookRecord& book) {
    auto& row = book.row;
    if (row.availableCopies + 1 > row.totalCopies) {
        throw LoanError::invariantViolation("release on book " + row.id + " would exceed total (available=" +
            std::to_string(row.availableCopies) + ", total=" + std::to_string(row.totalCopies) + ")");
    }
    ++row.availableCopies;
    uow.onRollback([&book] { --book.row.availableCopies; });
    return row;
}

Book InventoryLedger::adjustTotalCopies(const BookId& bookId, int newTotal) {
    auto& rec = require(bookId);
    UnitOfWork uow;
    uow.lock(rec);
    auto& row = rec.row;
    const int active = row.totalCopies - row.availableCopies;
    if (newTotal < 0) {
        throw LoanError::validation("total copies cannot be negative");
    }
    if (newTotal < active) {
        spdlog::debug("inventory_ledger: rejected total={} for book {} with {} active loans",
                      newTotal, row.id, active);
        throw LoanError::validation("book '" + row.id + "' has " + std::to_string(active) +
                                    " active loans, total cannot drop to " + std::to_string(newTotal));
    }
    const int oldTotal = row.totalCopies;
    row.totalCopies = newTotal;
    row.availableCopies = newTotal - active;
    uow.commit();
    spdlog::info("inventory_ledger: book {} total copies {} -> {}", row.id, oldTotal, newTotal);
    return row;
}

Book InventoryLedger::snapshot(const BookId& bookId) const {
    auto& rec = require(bookId);
    std::lock_guard<std::mutex> guard(rec.lock);
    return rec.row;
}

} // namespace circ
