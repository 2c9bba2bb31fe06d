#pragma once
#include <string>
#include <vector>
#include <optional>
#include <chrono>
#include <cstdint>

namespace circ {

using Clock     = std::chrono::system_clock;
using Timestamp = std::chrono::sys_seconds;

using BookId = std::string;
using UserId = std::string;
using LoanId = std::string;

enum class Role { Member, Librarian, Admin };

// Solo estos dos estados se guardan; "Overdue" se calcula al leer.
enum class LoanStatus { Active, Returned };

enum class EffectiveStatus { Active, Overdue, Returned };

struct Book {
    BookId id;
    std::string title;
    std::string author;
    std::string isbn;          // único en todo el catálogo
    std::string categoryId;
    std::string publisher;
    int year{};                // 0 = desconocido
    int totalCopies{};
    int availableCopies{};     // 0 <= availableCopies <= totalCopies
};

struct User {
    UserId id;
    std::string username;
    Role role{Role::Member};
};

// Identidad ya autenticada que llega del colaborador de auth.
struct Actor {
    UserId id;
    Role role{Role::Member};
};

struct Loan {
    LoanId id;
    BookId bookId;
    UserId userId;
    Timestamp loanDate;
    Timestamp dueDate;
    std::optional<Timestamp> returnDate;   // presente sii status == Returned
    LoanStatus status{LoanStatus::Active};
    std::uint64_t seq{};                   // orden de creación
};

struct LoanStatusView {
    LoanStatus stored{LoanStatus::Active};
    EffectiveStatus effective{EffectiveStatus::Active};
    Timestamp dueDate;
    std::optional<Timestamp> returnDate;
};

struct UserLoanStats {
    int activeLoans{};
    int totalLoans{};
    int overdueLoans{};
    bool canBorrow{false};
};

struct LoanQuery {
    std::optional<EffectiveStatus> status;
    std::optional<UserId> userId;
    std::optional<BookId> bookId;
    int page{1};
    int limit{10};
};

template <typename T>
struct Page {
    int total{};
    int page{1};
    int limit{10};
    std::vector<T> items;
};

const char* toString(Role r);
const char* toString(LoanStatus s);
const char* toString(EffectiveStatus s);

// Única puerta de entrada desde strings hacia Role; lanza VALIDATION_ERROR.
Role parseRole(const std::string& s);
// "active" | "returned" | "overdue"
EffectiveStatus parseStatusFilter(const std::string& s);

// Ids: 1..64 chars de [A-Za-z0-9_-]; lanza VALIDATION_ERROR.
void validateId(const char* what, const std::string& id);

Timestamp now_utc();
Timestamp addDays(Timestamp base, int d);
Timestamp makeTime(int y, unsigned m, unsigned d, int hour = 0);

} // namespace circ
