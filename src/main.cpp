#include "circulation/loan_service.hpp"
#include <algorithm>
#include <iostream>
#include <spdlog/spdlog.h>

using namespace circ;

static void printLoan(const Loan& l, Timestamp now) {
    std::cout << l.id << " book=" << l.bookId << " user=" << l.userId
              << " status=" << toString(LoanStateMachine::effectiveStatus(l, now)) << "\n";
}

int main() {
    EngineConfig cfg;
    try {
        cfg = EngineConfig::fromEnv();
    } catch (const LoanError& e) {
        std::cerr << "config: " << e.what() << " " << e.detail() << "\n";
        return 1;
    }
    configureLogging(cfg);

    try {
        LoanStore store;
        LoanService svc(store, cfg);

        const Actor admin{"U0", Role::Admin};
        const Actor ana{"U1", Role::Member};
        const Actor beto{"U2", Role::Member};
        const Actor carla{"U3", Role::Member};

        // Datos base
        svc.registerUser(User{"U0", "admin", Role::Admin});
        svc.registerUser(User{"U1", "ana", Role::Member});
        svc.registerUser(User{"U2", "beto", Role::Member});
        svc.registerUser(User{"U3", "carla", Role::Member});
        svc.registerBook(admin, Book{"B1", "Software Engineering", "Ian Sommerville", "9780133943030",
                                     "C1", "Pearson", 2015, 2, 0});
        svc.registerBook(admin, Book{"B2", "The C++ Programming Language", "Bjarne Stroustrup",
                                     "9780321563842", "C1", "Addison-Wesley", 2013,
                                     std::max(5, cfg.maxActiveLoans), 0});

        const Timestamp d1 = now_utc();

        // 1) Dos préstamos agotan B1; el tercero recibe OUT_OF_STOCK
        Loan la = svc.createLoan(ana, "B1", d1);
        std::cout << "Loan " << la.id << " creado. available=" << svc.getBook("B1").availableCopies << "\n";
        svc.createLoan(beto, "B1", d1);
        std::cout << "available=" << svc.getBook("B1").availableCopies << "\n";
        try { svc.createLoan(carla, "B1", d1); std::cout << "[ERROR] préstamo sin stock permitido\n"; }
        catch (const LoanError& e) { std::cout << "[OK] Sin stock: " << e.what() << "\n"; }

        // 2) Devolución libera una copia; la segunda devolución falla
        svc.returnLoan(ana, la.id, d1);
        std::cout << "Devuelto " << la.id << ". available=" << svc.getBook("B1").availableCopies << "\n";
        try { svc.returnLoan(ana, la.id, d1); std::cout << "[ERROR] doble devolución permitida\n"; }
        catch (const LoanError& e) { std::cout << "[OK] Doble devolución: " << e.what() << "\n"; }

        // 3) Tope de préstamos activos (B2 tiene al menos maxActiveLoans copias)
        for (int i = 0; i < cfg.maxActiveLoans; ++i) svc.createLoan(carla, "B2", d1);
        try { svc.createLoan(carla, "B2", d1); std::cout << "[ERROR] préstamo extra permitido\n"; }
        catch (const LoanError& e) { std::cout << "[OK] Tope de préstamos: " << e.what() << "\n"; }

        // 4) Pasado el plazo los préstamos activos se leen como vencidos
        const Timestamp later = addDays(d1, cfg.loanPeriodDays + 1);
        auto stats = svc.getUserLoanStats(carla, carla.id, later);
        std::cout << "carla: active=" << stats.activeLoans << " overdue=" << stats.overdueLoans
                  << " can_borrow=" << (stats.canBorrow ? "yes" : "no") << "\n";
        for (const auto& l : svc.listOverdueLoans(admin, 1, 10, later).items) printLoan(l, later);
    } catch (const LoanError& e) {
        spdlog::error("demo aborted: {} {}", e.what(), e.detail());
        return 1;
    }

    spdlog::info("demo finished");
    std::cout << "OK\n";
    return 0;
}
