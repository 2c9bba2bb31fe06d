#pragma once
#include "circulation/types.hpp"
#include <map>
#include <set>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <atomic>
#include <functional>

namespace circ {

// --- Filas ---
// Los campos mutables de un préstamo solo se tocan con el lock del usuario dueño.
struct LoanRecord {
    Loan row;
};

struct BookRecord {
    mutable std::mutex lock;
    Book row;
};

struct UserRecord {
    mutable std::mutex lock;
    User row;
    std::vector<LoanRecord*> loans;   // en orden de creación
};

// --- Unidad de trabajo ---
// Toma locks de fila y acumula acciones de deshacer. Si se destruye sin commit()
// deshace todo en orden inverso y después suelta los locks.
class UnitOfWork {
public:
    UnitOfWork() = default;
    ~UnitOfWork();
    UnitOfWork(const UnitOfWork&) = delete;
    UnitOfWork& operator=(const UnitOfWork&) = delete;

    void lock(const BookRecord& book);
    void lock(const UserRecord& user, const BookRecord& book);

    void onRollback(std::function<void()> undo);
    void commit() noexcept;
    bool committed() const { return committed_; }

private:
    void rollback() noexcept;

    std::vector<std::unique_lock<std::mutex>> locks_;
    std::vector<std::function<void()>> undo_;
    bool committed_{false};
};

// --- Almacén en memoria ---
// Cada tabla tiene su shared_mutex para estructura (buscar/insertar); nunca se
// mantiene mientras se espera un lock de fila.
class LoanStore {
public:
    LoanStore() = default;
    LoanStore(const LoanStore&) = delete;
    LoanStore& operator=(const LoanStore&) = delete;

    // nullptr si no existe
    BookRecord* findBook(const BookId& id) const;
    UserRecord* findUser(const UserId& id) const;
    LoanRecord* findLoan(const LoanId& id) const;

    BookRecord& insertBook(const Book& book);
    UserRecord& insertUser(const User& user);

    // Requiere el lock del usuario dueño; el rollback llama eraseLoan.
    LoanRecord& insertLoan(UserRecord& owner, Loan loan);
    void eraseLoan(UserRecord& owner, const LoanId& id) noexcept;

    LoanId nextLoanId(std::uint64_t& seq);

    std::vector<UserRecord*> allUsers() const;

private:
    mutable std::shared_mutex booksMutex;
    mutable std::shared_mutex usersMutex;
    mutable std::shared_mutex loansMutex;
    std::map<BookId, std::unique_ptr<BookRecord>> books;
    std::set<std::string> isbns;
    std::map<UserId, std::unique_ptr<UserRecord>> users;
    std::map<LoanId, std::unique_ptr<LoanRecord>> loans;
    std::atomic<std::uint64_t> loanCounter{0};
};

} // namespace circ
