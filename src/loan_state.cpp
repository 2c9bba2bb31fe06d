#include "circulation/loan_state.hpp"
#include "circulation/errors.hpp"
#include <spdlog/spdlog.h>

namespace circ {

LoanStateMachine::LoanStateMachine(LoanStore& store, InventoryLedger& ledger, int loanPeriodDays)
    : store(store), ledger(ledger), loanPeriodDays(loanPeriodDays) {}

Loan LoanStateMachine::create(UnitOfWork& uow, UserRecord& borrower, const BookRecord& book,
                              Timestamp now) {
    Loan loan;
    loan.id       = store.nextLoanId(loan.seq);
    loan.bookId   = book.row.id;
    loan.userId   = borrower.row.id;
    loan.loanDate = now;
    loan.dueDate  = addDays(now, loanPeriodDays);
    loan.status   = LoanStatus::Active;

    Loan out = loan;
    // último paso que puede fallar antes del commit; el undo se registra solo si
    // la fila quedó insertada
    store.insertLoan(borrower, std::move(loan));
    try {
        uow.onRollback([this, &borrower, id = out.id] { store.eraseLoan(borrower, id); });
    } catch (...) {
        store.eraseLoan(borrower, out.id);
        throw;
    }
    return out;
}

Loan LoanStateMachine::markReturned(UnitOfWork& uow, LoanRecord& loan, BookRecord& book,
                                    Timestamp now) {
    auto& row = loan.row;
    if (row.status == LoanStatus::Returned) {
        throw LoanError::alreadyReturned("loan '" + row.id + "' was already returned");
    }
    if (row.returnDate.has_value()) {
        throw LoanError::invariantViolation("active loan " + row.id + " has a return date");
    }
    if (row.bookId != book.row.id) {
        throw LoanError::invariantViolation("loan " + row.id + " is not for book " + book.row.id);
    }

    row.status = LoanStatus::Returned;
    row.returnDate = now;
    uow.onRollback([&row] {
        row.status = LoanStatus::Active;
        row.returnDate.reset();
    });

    ledger.releaseCopy(uow, book);
    return row;
}

EffectiveStatus LoanStateMachine::effectiveStatus(const Loan& loan, Timestamp now) {
    if (loan.status == LoanStatus::Returned) return EffectiveStatus::Returned;
    if (loan.dueDate < now) return EffectiveStatus::Overdue;
    return EffectiveStatus::Active;
}

LoanStatusView LoanStateMachine::view(const Loan& loan, Timestamp now) {
    LoanStatusView v;
    v.stored     = loan.status;
    v.effective  = effectiveStatus(loan, now);
    v.dueDate    = loan.dueDate;
    v.returnDate = loan.returnDate;
    return v;
}

} // namespace circ
