#include "circulation/eligibility.hpp"
#include "circulation/errors.hpp"
#include "circulation/loan_state.hpp"
#include <spdlog/spdlog.h>

namespace circ {

EligibilityGuard::EligibilityGuard(int maxActiveLoans) : maxActiveLoans(maxActiveLoans) {}

UserLoanStats EligibilityGuard::stats(const UserRecord& user, Timestamp now) const {
    UserLoanStats s;
    for (const LoanRecord* rec : user.loans) {
        ++s.totalLoans;
        switch (LoanStateMachine::effectiveStatus(rec->row, now)) {
            case EffectiveStatus::Overdue:
                ++s.overdueLoans;
                ++s.activeLoans;
                break;
            case EffectiveStatus::Active:
                ++s.activeLoans;
                break;
            case EffectiveStatus::Returned:
                break;
        }
    }
    s.canBorrow = s.overdueLoans == 0 && s.activeLoans < maxActiveLoans;
    return s;
}

void EligibilityGuard::check(const UserRecord& user, const Book& book, Timestamp now) const {
    const auto s = stats(user, now);
    if (s.activeLoans >= maxActiveLoans) {
        spdlog::debug("eligibility: user {} already has {} active loans", user.row.id, s.activeLoans);
        throw LoanError::exceedsLoanLimit("user already has " + std::to_string(s.activeLoans) +
                                          " active loans, return a book before borrowing another");
    }
    if (s.overdueLoans > 0) {
        spdlog::debug("eligibility: user {} has {} overdue loans", user.row.id, s.overdueLoans);
        throw LoanError::hasOverdueLoans("user has overdue loans, return them before borrowing");
    }
    if (book.availableCopies <= 0) {
        throw LoanError::outOfStock("book '" + book.id + "' not available for loan");
    }
}

} // namespace circ
