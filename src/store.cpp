#include "circulation/store.hpp"
#include "circulation/errors.hpp"
#include <algorithm>

namespace circ {

// ----- UnitOfWork -----
UnitOfWork::~UnitOfWork() {
    if (!committed_) rollback();
    // locks_ se suelta después, al destruirse el miembro
}

void UnitOfWork::lock(const BookRecord& book) {
    locks_.emplace_back(book.lock);
}

void UnitOfWork::lock(const UserRecord& user, const BookRecord& book) {
    std::unique_lock<std::mutex> u(user.lock, std::defer_lock);
    std::unique_lock<std::mutex> b(book.lock, std::defer_lock);
    std::lock(u, b);
    locks_.push_back(std::move(u));
    locks_.push_back(std::move(b));
}

void UnitOfWork::onRollback(std::function<void()> undo) {
    undo_.push_back(std::move(undo));
}

void UnitOfWork::commit() noexcept {
    committed_ = true;
    undo_.clear();
}

void UnitOfWork::rollback() noexcept {
    for (auto it = undo_.rbegin(); it != undo_.rend(); ++it) (*it)();
    undo_.clear();
}

// ----- LoanStore -----
BookRecord* LoanStore::findBook(const BookId& id) const {
    std::shared_lock<std::shared_mutex> guard(booksMutex);
    auto it = books.find(id);
    return it == books.end() ? nullptr : it->second.get();
}

UserRecord* LoanStore::findUser(const UserId& id) const {
    std::shared_lock<std::shared_mutex> guard(usersMutex);
    auto it = users.find(id);
    return it == users.end() ? nullptr : it->second.get();
}

LoanRecord* LoanStore::findLoan(const LoanId& id) const {
    std::shared_lock<std::shared_mutex> guard(loansMutex);
    auto it = loans.find(id);
    return it == loans.end() ? nullptr : it->second.get();
}

BookRecord& LoanStore::insertBook(const Book& book) {
    std::unique_lock<std::shared_mutex> guard(booksMutex);
    if (books.count(book.id)) throw LoanError::validation("book '" + book.id + "' already exists");
    if (isbns.count(book.isbn)) throw LoanError::validation("ISBN '" + book.isbn + "' already exists");
    auto rec = std::make_unique<BookRecord>();
    rec->row = book;
    auto& ref = *rec;
    books.emplace(book.id, std::move(rec));
    isbns.insert(book.isbn);
    return ref;
}

UserRecord& LoanStore::insertUser(const User& user) {
    std::unique_lock<std::shared_mutex> guard(usersMutex);
    if (users.count(user.id)) throw LoanError::validation("user '" + user.id + "' already exists");
    auto rec = std::make_unique<UserRecord>();
    rec->row = user;
    auto& ref = *rec;
    users.emplace(user.id, std::move(rec));
    return ref;
}

LoanRecord& LoanStore::insertLoan(UserRecord& owner, Loan loan) {
    const LoanId id = loan.id;
    auto rec = std::make_unique<LoanRecord>();
    rec->row = std::move(loan);
    auto& ref = *rec;
    owner.loans.reserve(owner.loans.size() + 1);   // el push_back de abajo no falla
    {
        std::unique_lock<std::shared_mutex> guard(loansMutex);
        const bool inserted = loans.try_emplace(id, std::move(rec)).second;
        if (!inserted) throw LoanError::invariantViolation("duplicate loan id " + id);
    }
    owner.loans.push_back(&ref);
    return ref;
}

void LoanStore::eraseLoan(UserRecord& owner, const LoanId& id) noexcept {
    auto& v = owner.loans;
    v.erase(std::remove_if(v.begin(), v.end(),
                           [&](const LoanRecord* r) { return r->row.id == id; }),
            v.end());
    std::unique_lock<std::shared_mutex> guard(loansMutex);
    loans.erase(id);
}

LoanId LoanStore::nextLoanId(std::uint64_t& seq) {
    seq = ++loanCounter;
    return "L" + std::to_string(seq);
}

std::vector<UserRecord*> LoanStore::allUsers() const {
    std::shared_lock<std::shared_mutex> guard(usersMutex);
    std::vector<UserRecord*> out;
    out.reserve(users.size());
    for (auto& kv : users) out.push_back(kv.second.get());
    return out;
}

} // namespace circ
