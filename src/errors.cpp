#include "circulation/errors.hpp"
#include <spdlog/spdlog.h>

namespace circ {

const char* toCode(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Validation:         return "VALIDATION_ERROR";
        case ErrorKind::NotFound:           return "NOT_FOUND";
        case ErrorKind::OutOfStock:         return "OUT_OF_STOCK";
        case ErrorKind::ExceedsLoanLimit:   return "EXCEEDS_LOAN_LIMIT";
        case ErrorKind::HasOverdueLoans:    return "HAS_OVERDUE_LOANS";
        case ErrorKind::AlreadyReturned:    return "ALREADY_RETURNED";
        case ErrorKind::Forbidden:          return "FORBIDDEN";
        case ErrorKind::InvariantViolation: return "INVARIANT_VIOLATION";
    }
    return "UNKNOWN";
}

LoanError::LoanError(ErrorKind kind, std::string detail)
    : std::runtime_error(toCode(kind)), kind_(kind), detail_(std::move(detail)) {}

LoanError LoanError::validation(const std::string& detail) {
    return LoanError(ErrorKind::Validation, detail);
}
LoanError LoanError::notFound(const std::string& detail) {
    return LoanError(ErrorKind::NotFound, detail);
}
LoanError LoanError::outOfStock(const std::string& detail) {
    return LoanError(ErrorKind::OutOfStock, detail);
}
LoanError LoanError::exceedsLoanLimit(const std::string& detail) {
    return LoanError(ErrorKind::ExceedsLoanLimit, detail);
}
LoanError LoanError::hasOverdueLoans(const std::string& detail) {
    return LoanError(ErrorKind::HasOverdueLoans, detail);
}
LoanError LoanError::alreadyReturned(const std::string& detail) {
    return LoanError(ErrorKind::AlreadyReturned, detail);
}
LoanError LoanError::forbidden(const std::string& detail) {
    return LoanError(ErrorKind::Forbidden, detail);
}

LoanError LoanError::invariantViolation(const std::string& logDetail) {
    spdlog::error("invariant violation: {}", logDetail);
    return LoanError(ErrorKind::InvariantViolation, "internal consistency failure");
}

} // namespace circ
