#pragma once
#include "circulation/authorization.hpp"
#include "circulation/config.hpp"
#include "circulation/eligibility.hpp"
#include "circulation/errors.hpp"
#include "circulation/loan_state.hpp"

namespace circ {

// --- Servicio principal ---
// Préstamo: política -> elegibilidad -> reserva -> alta, todo con los locks del
// usuario y del libro dentro de una sola unidad de trabajo.
// Devolución: política -> markReturned (libera la copia) en una unidad de trabajo.
class LoanService {
    LoanStore& store;
    EngineConfig cfg;
    InventoryLedger ledger;
    LoanStateMachine loans;
    EligibilityGuard guard;
public:
    explicit LoanService(LoanStore& store, EngineConfig cfg = {});

    Loan createLoan(const Actor& actor, const BookId& bookId, Timestamp now = now_utc());
    Loan createLoanFor(const Actor& actor, const UserId& borrowerId, const BookId& bookId,
                       Timestamp now = now_utc());
    Loan returnLoan(const Actor& actor, const LoanId& loanId, Timestamp now = now_utc());

    LoanStatusView getLoanStatus(const LoanId& loanId, Timestamp now = now_utc()) const;
    UserLoanStats getUserLoanStats(const Actor& actor, const UserId& userId,
                                   Timestamp now = now_utc()) const;

    Page<Loan> listLoans(const Actor& actor, const LoanQuery& query,
                         Timestamp now = now_utc()) const;
    Page<Loan> myLoans(const Actor& actor, int page = 1, int limit = 10) const;
    Page<Loan> listOverdueLoans(const Actor& actor, int page = 1, int limit = 10,
                                Timestamp now = now_utc()) const;

    // Catálogo (bibliotecario/admin)
    Book registerBook(const Actor& actor, Book book);
    Book adjustTotalCopies(const Actor& actor, const BookId& bookId, int newTotal);
    Book getBook(const BookId& bookId) const;

    // Alta de usuarios desde el colaborador de identidad; no pasa por la política.
    User registerUser(const User& user);

    const EngineConfig& config() const { return cfg; }

private:
    std::vector<Loan> loansOf(const UserRecord& user) const;
};

} // namespace circ
