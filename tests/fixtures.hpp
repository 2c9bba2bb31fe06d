#pragma once
#include "circulation/loan_service.hpp"

namespace circ::test {

inline const Actor kAdmin{"U0", Role::Admin};
inline const Actor kLibrarian{"U9", Role::Librarian};
inline const Actor kAna{"U1", Role::Member};
inline const Actor kBeto{"U2", Role::Member};
inline const Actor kCarla{"U3", Role::Member};

inline Timestamp day0() { return makeTime(2025, 10, 1, 9); }

inline Book makeBook(const std::string& id, const std::string& isbn, int copies) {
    Book b;
    b.id = id;
    b.title = "Title " + id;
    b.author = "Author " + id;
    b.isbn = isbn;
    b.categoryId = "C1";
    b.totalCopies = copies;
    return b;
}

// B1: 2 copias, B2: 1 copia, B3: 5 copias
inline void seedMinimal(LoanService& svc) {
    svc.registerUser(User{"U0", "admin", Role::Admin});
    svc.registerUser(User{"U9", "librarian", Role::Librarian});
    svc.registerUser(User{"U1", "ana", Role::Member});
    svc.registerUser(User{"U2", "beto", Role::Member});
    svc.registerUser(User{"U3", "carla", Role::Member});
    svc.registerBook(kAdmin, makeBook("B1", "9780133943030", 2));
    svc.registerBook(kAdmin, makeBook("B2", "9780321563842", 1));
    svc.registerBook(kAdmin, makeBook("B3", "9780201633610", 5));
}

} // namespace circ::test
