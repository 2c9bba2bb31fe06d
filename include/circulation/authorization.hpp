#pragma once
#include "circulation/types.hpp"
#include <optional>

namespace circ {

enum class Action {
    CreateLoan,
    ReturnLoan,
    ViewLoans,        // préstamos o estadísticas de un usuario
    ViewAllLoans,     // listado global y vencidos
    ManageCatalog,
    ChangeUserRole
};

enum class Capability : unsigned {
    OwnLoans  = 1u << 0,
    AnyLoan   = 1u << 1,
    Catalog   = 1u << 2,
    UserRoles = 1u << 3
};

// Matriz cerrada rol -> capacidades. Ningún otro sitio compara roles.
class AuthorizationPolicy {
public:
    static unsigned capabilities(Role role);
    static bool has(Role role, Capability cap);

    // Para acciones sobre préstamos, owner decide entre OwnLoans y AnyLoan.
    static bool authorize(const Actor& actor, Action action,
                          const std::optional<UserId>& owner = std::nullopt);

    // Lanza FORBIDDEN si authorize() niega.
    static void require(const Actor& actor, Action action,
                        const std::optional<UserId>& owner = std::nullopt);
};

const char* toString(Action a);

} // namespace circ
