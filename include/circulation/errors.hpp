#pragma once
#include <stdexcept>
#include <string>

namespace circ {

enum class ErrorKind {
    Validation,
    NotFound,
    OutOfStock,
    ExceedsLoanLimit,
    HasOverdueLoans,
    AlreadyReturned,
    Forbidden,
    InvariantViolation
};

// Código estable en mayúsculas, p.ej. "OUT_OF_STOCK".
const char* toCode(ErrorKind kind);

// what() devuelve siempre el código; el mensaje legible va en detail().
class LoanError : public std::runtime_error {
public:
    LoanError(ErrorKind kind, std::string detail);

    ErrorKind kind() const { return kind_; }
    const std::string& detail() const { return detail_; }

    static LoanError validation(const std::string& detail);
    static LoanError notFound(const std::string& detail);
    static LoanError outOfStock(const std::string& detail);
    static LoanError exceedsLoanLimit(const std::string& detail);
    static LoanError hasOverdueLoans(const std::string& detail);
    static LoanError alreadyReturned(const std::string& detail);
    static LoanError forbidden(const std::string& detail);
    // El detalle se registra en el log y no viaja en la excepción.
    static LoanError invariantViolation(const std::string& logDetail);

private:
    ErrorKind kind_;
    std::string detail_;
};

} // namespace circ
