#pragma once
#include "circulation/store.hpp"

namespace circ {

// Dueño de los contadores de copias. availableCopies nunca sale de [0, totalCopies].
// Todas las operaciones sobre un mismo libro se serializan con el lock de su fila.
class InventoryLedger {
    LoanStore& store;
public:
    explicit InventoryLedger(LoanStore& store);

    // Operaciones atómicas por sí solas (toman el lock del libro).
    Book reserveCopy(const BookId& bookId);
    Book releaseCopy(const BookId& bookId);

    // Dentro de una unidad de trabajo que ya tiene el lock del libro;
    // el rollback restaura el contador.
    Book reserveCopy(UnitOfWork& uow, BookRecord& book);
    Book releaseCopy(UnitOfWork& uow, BookRecord& book);

    // Rechaza (VALIDATION_ERROR) si newTotal < préstamos activos del libro.
    Book adjustTotalCopies(const BookId& bookId, int newTotal);

    Book snapshot(const BookId& bookId) const;

private:
    BookRecord& require(const BookId& bookId) const;
};

} // namespace circ
