#include "circulation/loan_service.hpp"
#include <algorithm>
#include <iterator>
#include <spdlog/spdlog.h>

namespace circ {

static void checkPaging(int page, int limit) {
    if (page < 1) throw LoanError::validation("page must be >= 1");
    if (limit < 1 || limit > 100) throw LoanError::validation("limit must be within 1..100");
}

static Page<Loan> paginate(std::vector<Loan> all, int page, int limit) {
    Page<Loan> out;
    out.total = static_cast<int>(all.size());
    out.page  = page;
    out.limit = limit;
    const std::size_t offset = static_cast<std::size_t>(page - 1) * static_cast<std::size_t>(limit);
    if (offset >= all.size()) return out;
    const std::size_t end = std::min(all.size(), offset + static_cast<std::size_t>(limit));
    out.items.assign(std::make_move_iterator(all.begin() + offset),
                     std::make_move_iterator(all.begin() + end));
    return out;
}

static void newestFirst(std::vector<Loan>& v) {
    std::sort(v.begin(), v.end(), [](const Loan& a, const Loan& b) {
        if (a.loanDate != b.loanDate) return a.loanDate > b.loanDate;
        return a.seq > b.seq;
    });
}

LoanService::LoanService(LoanStore& store, EngineConfig cfg)
    : store(store),
      cfg(std::move(cfg)),
      ledger(store),
      loans(store, ledger, this->cfg.loanPeriodDays),
      guard(this->cfg.maxActiveLoans) {}

// ----- Préstamos -----
Loan LoanService::createLoan(const Actor& actor, const BookId& bookId, Timestamp now) {
    return createLoanFor(actor, actor.id, bookId, now);
}

Loan LoanService::createLoanFor(const Actor& actor, const UserId& borrowerId, const BookId& bookId,
                                Timestamp now) {
    validateId("user", borrowerId);
    validateId("book", bookId);
    AuthorizationPolicy::require(actor, Action::CreateLoan, borrowerId);

    UserRecord* user = store.findUser(borrowerId);
    if (!user) throw LoanError::notFound("user '" + borrowerId + "' not found");
    BookRecord* book = store.findBook(bookId);
    if (!book) throw LoanError::notFound("book '" + bookId + "' not found");

    UnitOfWork uow;
    uow.lock(*user, *book);
    guard.check(*user, book->row, now);
    ledger.reserveCopy(uow, *book);
    Loan loan = loans.create(uow, *user, *book, now);
    uow.commit();

    spdlog::info("loan_service: loan {} created (user={}, book={}, by={}, available={})",
                 loan.id, loan.userId, loan.bookId, actor.id, book->row.availableCopies);
    return loan;
}

Loan LoanService::returnLoan(const Actor& actor, const LoanId& loanId, Timestamp now) {
    validateId("loan", loanId);
    LoanRecord* rec = store.findLoan(loanId);
    if (!rec) throw LoanError::notFound("loan '" + loanId + "' not found");

    // userId y bookId no cambian después del alta
    const UserId ownerId = rec->row.userId;
    const BookId bookId  = rec->row.bookId;
    AuthorizationPolicy::require(actor, Action::ReturnLoan, ownerId);

    UserRecord* owner = store.findUser(ownerId);
    BookRecord* book  = store.findBook(bookId);
    if (!owner || !book) {
        throw LoanError::invariantViolation("loan " + loanId + " references a missing user or book");
    }

    UnitOfWork uow;
    uow.lock(*owner, *book);
    Loan loan = loans.markReturned(uow, *rec, *book, now);
    uow.commit();

    spdlog::info("loan_service: loan {} returned (user={}, book={}, by={}, available={})",
                 loan.id, loan.userId, loan.bookId, actor.id, book->row.availableCopies);
    return loan;
}

LoanStatusView LoanService::getLoanStatus(const LoanId& loanId, Timestamp now) const {
    validateId("loan", loanId);
    LoanRecord* rec = store.findLoan(loanId);
    if (!rec) throw LoanError::notFound("loan '" + loanId + "' not found");
    UserRecord* owner = store.findUser(rec->row.userId);
    if (!owner) throw LoanError::invariantViolation("loan " + loanId + " has no owner row");

    std::lock_guard<std::mutex> lk(owner->lock);
    return LoanStateMachine::view(rec->row, now);
}

UserLoanStats LoanService::getUserLoanStats(const Actor& actor, const UserId& userId,
                                            Timestamp now) const {
    validateId("user", userId);
    AuthorizationPolicy::require(actor, Action::ViewLoans, userId);
    UserRecord* user = store.findUser(userId);
    if (!user) throw LoanError::notFound("user '" + userId + "' not found");

    std::lock_guard<std::mutex> lk(user->lock);
    return guard.stats(*user, now);
}

// ----- Listados -----
std::vector<Loan> LoanService::loansOf(const UserRecord& user) const {
    std::lock_guard<std::mutex> lk(user.lock);
    std::vector<Loan> out;
    out.reserve(user.loans.size());
    for (const LoanRecord* rec : user.loans) out.push_back(rec->row);
    return out;
}

Page<Loan> LoanService::listLoans(const Actor& actor, const LoanQuery& query, Timestamp now) const {
    checkPaging(query.page, query.limit);
    if (query.userId) validateId("user", *query.userId);
    if (query.bookId) validateId("book", *query.bookId);

    std::optional<UserId> scope = query.userId;
    if (!AuthorizationPolicy::authorize(actor, Action::ViewAllLoans)) {
        // miembros: solo lo propio, y pedir lo ajeno es FORBIDDEN
        AuthorizationPolicy::require(actor, Action::ViewLoans, query.userId.value_or(actor.id));
        scope = actor.id;
    }

    std::vector<UserRecord*> users;
    if (scope) {
        UserRecord* u = store.findUser(*scope);
        if (!u) throw LoanError::notFound("user '" + *scope + "' not found");
        users.push_back(u);
    } else {
        users = store.allUsers();
    }

    std::vector<Loan> matched;
    for (const UserRecord* u : users) {
        for (auto& l : loansOf(*u)) {
            if (query.bookId && l.bookId != *query.bookId) continue;
            if (query.status && LoanStateMachine::effectiveStatus(l, now) != *query.status) continue;
            matched.push_back(std::move(l));
        }
    }
    newestFirst(matched);
    return paginate(std::move(matched), query.page, query.limit);
}

Page<Loan> LoanService::myLoans(const Actor& actor, int page, int limit) const {
    checkPaging(page, limit);
    validateId("user", actor.id);
    UserRecord* u = store.findUser(actor.id);
    if (!u) throw LoanError::notFound("user '" + actor.id + "' not found");
    auto all = loansOf(*u);
    newestFirst(all);
    return paginate(std::move(all), page, limit);
}

Page<Loan> LoanService::listOverdueLoans(const Actor& actor, int page, int limit, Timestamp now) const {
    checkPaging(page, limit);
    AuthorizationPolicy::require(actor, Action::ViewAllLoans);

    std::vector<Loan> overdue;
    for (const UserRecord* u : store.allUsers()) {
        for (auto& l : loansOf(*u)) {
            if (LoanStateMachine::effectiveStatus(l, now) == EffectiveStatus::Overdue) {
                overdue.push_back(std::move(l));
            }
        }
    }
    std::sort(overdue.begin(), overdue.end(), [](const Loan& a, const Loan& b) {
        if (a.dueDate != b.dueDate) return a.dueDate < b.dueDate;
        return a.seq < b.seq;
    });
    return paginate(std::move(overdue), page, limit);
}

// ----- Catálogo -----
Book LoanService::registerBook(const Actor& actor, Book book) {
    AuthorizationPolicy::require(actor, Action::ManageCatalog);
    validateId("book", book.id);
    if (!book.categoryId.empty()) validateId("category", book.categoryId);
    if (book.isbn.size() < 10 || book.isbn.size() > 13) {
        throw LoanError::validation("ISBN must have 10..13 characters");
    }
    if (book.title.empty() || book.author.empty()) {
        throw LoanError::validation("title and author are required");
    }
    if (book.year != 0 && (book.year < 1000 || book.year > 9999)) {
        throw LoanError::validation("year must be within 1000..9999");
    }
    if (book.totalCopies < 0) throw LoanError::validation("total copies cannot be negative");

    book.availableCopies = book.totalCopies;
    store.insertBook(book);
    spdlog::info("loan_service: book {} registered (isbn={}, copies={})", book.id, book.isbn,
                 book.totalCopies);
    return book;
}

Book LoanService::adjustTotalCopies(const Actor& actor, const BookId& bookId, int newTotal) {
    AuthorizationPolicy::require(actor, Action::ManageCatalog);
    return ledger.adjustTotalCopies(bookId, newTotal);
}

Book LoanService::getBook(const BookId& bookId) const {
    return ledger.snapshot(bookId);
}

User LoanService::registerUser(const User& user) {
    validateId("user", user.id);
    if (user.username.size() < 3 || user.username.size() > 50) {
        throw LoanError::validation("username must have 3..50 characters");
    }
    store.insertUser(user);
    spdlog::info("loan_service: user {} registered as {}", user.id, toString(user.role));
    return user;
}

} // namespace circ
