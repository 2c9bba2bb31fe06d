#pragma once
#include "circulation/inventory_ledger.hpp"

namespace circ {

// Active -> Returned, sin vuelta atrás.
class LoanStateMachine {
    LoanStore& store;
    InventoryLedger& ledger;
    int loanPeriodDays;
public:
    LoanStateMachine(LoanStore& store, InventoryLedger& ledger, int loanPeriodDays);

    // Llamar solo después de EligibilityGuard y reserveCopy, en la misma unidad de trabajo.
    Loan create(UnitOfWork& uow, UserRecord& borrower, const BookRecord& book, Timestamp now);

    // Requiere los locks del dueño y del libro. Libera la copia en la misma unidad.
    Loan markReturned(UnitOfWork& uow, LoanRecord& loan, BookRecord& book, Timestamp now);

    static EffectiveStatus effectiveStatus(const Loan& loan, Timestamp now);
    static LoanStatusView view(const Loan& loan, Timestamp now);
};

} // namespace circ
