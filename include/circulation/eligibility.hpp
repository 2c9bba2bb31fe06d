#pragma once
#include "circulation/store.hpp"

namespace circ {

// Reglas por usuario: tope de préstamos activos y ningún préstamo vencido.
// Se evalúa con el lock del usuario tomado.
class EligibilityGuard {
    int maxActiveLoans;
public:
    explicit EligibilityGuard(int maxActiveLoans);

    // EXCEEDS_LOAN_LIMIT, HAS_OVERDUE_LOANS, y OUT_OF_STOCK como chequeo previo
    // (la reserva en el ledger vuelve a verificarlo).
    void check(const UserRecord& user, const Book& book, Timestamp now) const;

    UserLoanStats stats(const UserRecord& user, Timestamp now) const;
};

} // namespace circ
