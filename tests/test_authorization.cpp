#include <catch2/catch_all.hpp>
#include "fixtures.hpp"

using namespace circ;
using namespace circ::test;

TEST_CASE("Matriz de capacidades por rol") {
    using AP = AuthorizationPolicy;
    REQUIRE(AP::has(Role::Member, Capability::OwnLoans));
    REQUIRE_FALSE(AP::has(Role::Member, Capability::AnyLoan));
    REQUIRE_FALSE(AP::has(Role::Member, Capability::Catalog));
    REQUIRE_FALSE(AP::has(Role::Member, Capability::UserRoles));

    REQUIRE(AP::has(Role::Librarian, Capability::OwnLoans));
    REQUIRE(AP::has(Role::Librarian, Capability::AnyLoan));
    REQUIRE(AP::has(Role::Librarian, Capability::Catalog));
    REQUIRE_FALSE(AP::has(Role::Librarian, Capability::UserRoles));

    REQUIRE(AP::has(Role::Admin, Capability::OwnLoans));
    REQUIRE(AP::has(Role::Admin, Capability::AnyLoan));
    REQUIRE(AP::has(Role::Admin, Capability::Catalog));
    REQUIRE(AP::has(Role::Admin, Capability::UserRoles));
}

TEST_CASE("authorize: lecturas propias vs ajenas") {
    using AP = AuthorizationPolicy;
    REQUIRE(AP::authorize(kAna, Action::ViewLoans, kAna.id));
    REQUIRE_FALSE(AP::authorize(kAna, Action::ViewLoans, kBeto.id));
    REQUIRE(AP::authorize(kLibrarian, Action::ViewLoans, kBeto.id));
    REQUIRE(AP::authorize(kAdmin, Action::ViewLoans, kBeto.id));

    // sin dueño conocido hace falta AnyLoan
    REQUIRE_FALSE(AP::authorize(kAna, Action::ReturnLoan));
    REQUIRE(AP::authorize(kLibrarian, Action::ReturnLoan));
}

TEST_CASE("authorize: catálogo y roles") {
    using AP = AuthorizationPolicy;
    REQUIRE_FALSE(AP::authorize(kAna, Action::ManageCatalog));
    REQUIRE(AP::authorize(kLibrarian, Action::ManageCatalog));
    REQUIRE_FALSE(AP::authorize(kLibrarian, Action::ChangeUserRole));
    REQUIRE(AP::authorize(kAdmin, Action::ChangeUserRole));
    REQUIRE_FALSE(AP::authorize(kAna, Action::ViewAllLoans));
    REQUIRE(AP::authorize(kLibrarian, Action::ViewAllLoans));

    REQUIRE_THROWS_WITH(AP::require(kAna, Action::ChangeUserRole), "FORBIDDEN");
    REQUIRE_NOTHROW(AP::require(kAdmin, Action::ChangeUserRole));
}

TEST_CASE("parseRole: solo los tres roles conocidos") {
    REQUIRE(parseRole("member") == Role::Member);
    REQUIRE(parseRole("librarian") == Role::Librarian);
    REQUIRE(parseRole("admin") == Role::Admin);
    REQUIRE_THROWS_WITH(parseRole("Admin"), "VALIDATION_ERROR");
    REQUIRE_THROWS_WITH(parseRole("root"), "VALIDATION_ERROR");
}

TEST_CASE("Return: un miembro no devuelve préstamos ajenos") {
    LoanStore store; LoanService svc(store); seedMinimal(svc);
    Loan l = svc.createLoan(kAna, "B1", day0());
    REQUIRE_THROWS_WITH(svc.returnLoan(kBeto, l.id, day0()), "FORBIDDEN");
    REQUIRE(svc.getLoanStatus(l.id, day0()).stored == LoanStatus::Active);
    REQUIRE(svc.getBook("B1").availableCopies == 1);
}

TEST_CASE("Return: el bibliotecario procesa devoluciones ajenas") {
    LoanStore store; LoanService svc(store); seedMinimal(svc);
    Loan l = svc.createLoan(kAna, "B1", day0());
    Loan r = svc.returnLoan(kLibrarian, l.id, day0());
    REQUIRE(r.status == LoanStatus::Returned);
    REQUIRE(svc.getBook("B1").availableCopies == 2);
}

TEST_CASE("Return: FORBIDDEN antes que ALREADY_RETURNED") {
    LoanStore store; LoanService svc(store); seedMinimal(svc);
    Loan l = svc.createLoan(kAna, "B1", day0());
    svc.returnLoan(kAna, l.id, day0());
    REQUIRE_THROWS_WITH(svc.returnLoan(kBeto, l.id, day0()), "FORBIDDEN");
}

TEST_CASE("createLoanFor: el bibliotecario presta a nombre de otro") {
    LoanStore store; LoanService svc(store); seedMinimal(svc);
    Loan l = svc.createLoanFor(kLibrarian, kAna.id, "B1", day0());
    REQUIRE(l.userId == kAna.id);
    REQUIRE(svc.getUserLoanStats(kAna, kAna.id, day0()).activeLoans == 1);
    REQUIRE(svc.getUserLoanStats(kLibrarian, kLibrarian.id, day0()).activeLoans == 0);
}

TEST_CASE("createLoanFor: un miembro no presta a nombre de otro") {
    LoanStore store; LoanService svc(store); seedMinimal(svc);
    REQUIRE_THROWS_WITH(svc.createLoanFor(kAna, kBeto.id, "B1", day0()), "FORBIDDEN");
    REQUIRE(svc.getBook("B1").availableCopies == 2);
}

TEST_CASE("createLoanFor: usuario o libro inexistente") {
    LoanStore store; LoanService svc(store); seedMinimal(svc);
    REQUIRE_THROWS_WITH(svc.createLoanFor(kAdmin, "U404", "B1", day0()), "NOT_FOUND");
    REQUIRE_THROWS_WITH(svc.createLoan(kAna, "B404", day0()), "NOT_FOUND");
}

TEST_CASE("Stats: un miembro solo ve las propias") {
    LoanStore store; LoanService svc(store); seedMinimal(svc);
    REQUIRE_THROWS_WITH(svc.getUserLoanStats(kAna, kBeto.id), "FORBIDDEN");
    REQUIRE_NOTHROW(svc.getUserLoanStats(kLibrarian, kBeto.id));
    REQUIRE_NOTHROW(svc.getUserLoanStats(kAdmin, kBeto.id));
}

TEST_CASE("registerBook: solo bibliotecario o admin con ISBN único") {
    LoanStore store; LoanService svc(store); seedMinimal(svc);
    REQUIRE_THROWS_WITH(svc.registerBook(kAna, makeBook("B7", "9781111111111", 1)), "FORBIDDEN");

    Book b = svc.registerBook(kLibrarian, makeBook("B7", "9781111111111", 3));
    REQUIRE(b.availableCopies == 3);

    // mismo ISBN con otro id
    REQUIRE_THROWS_WITH(svc.registerBook(kAdmin, makeBook("B8", "9781111111111", 1)), "VALIDATION_ERROR");
    // ISBN corto, copias negativas
    REQUIRE_THROWS_WITH(svc.registerBook(kAdmin, makeBook("B9", "123", 1)), "VALIDATION_ERROR");
    REQUIRE_THROWS_WITH(svc.registerBook(kAdmin, makeBook("B9", "9782222222222", -1)), "VALIDATION_ERROR");
}

TEST_CASE("registerBook: un libro sin copias se registra y no se presta") {
    LoanStore store; LoanService svc(store); seedMinimal(svc);
    Book b = svc.registerBook(kAdmin, makeBook("BZ", "9783333333333", 0));
    REQUIRE(b.totalCopies == 0);
    REQUIRE(b.availableCopies == 0);
    REQUIRE_THROWS_WITH(svc.createLoan(kAna, "BZ", day0()), "OUT_OF_STOCK");

    Book more = svc.adjustTotalCopies(kLibrarian, "BZ", 1);
    REQUIRE(more.availableCopies == 1);
}
