#include "circulation/authorization.hpp"
#include "circulation/errors.hpp"
#include <spdlog/spdlog.h>

namespace circ {

static constexpr unsigned bit(Capability c) { return static_cast<unsigned>(c); }

unsigned AuthorizationPolicy::capabilities(Role role) {
    switch (role) {
        case Role::Member:
            return bit(Capability::OwnLoans);
        case Role::Librarian:
            return bit(Capability::OwnLoans) | bit(Capability::AnyLoan) | bit(Capability::Catalog);
        case Role::Admin:
            return bit(Capability::OwnLoans) | bit(Capability::AnyLoan) | bit(Capability::Catalog) |
                   bit(Capability::UserRoles);
    }
    return 0;
}

bool AuthorizationPolicy::has(Role role, Capability cap) {
    return (capabilities(role) & bit(cap)) != 0;
}

bool AuthorizationPolicy::authorize(const Actor& actor, Action action,
                                    const std::optional<UserId>& owner) {
    switch (action) {
        case Action::CreateLoan:
        case Action::ReturnLoan:
        case Action::ViewLoans: {
            const bool own = owner.has_value() && *owner == actor.id;
            return has(actor.role, own ? Capability::OwnLoans : Capability::AnyLoan);
        }
        case Action::ViewAllLoans:
            return has(actor.role, Capability::AnyLoan);
        case Action::ManageCatalog:
            return has(actor.role, Capability::Catalog);
        case Action::ChangeUserRole:
            return has(actor.role, Capability::UserRoles);
    }
    return false;
}

void AuthorizationPolicy::require(const Actor& actor, Action action,
                                  const std::optional<UserId>& owner) {
    if (authorize(actor, action, owner)) return;
    spdlog::debug("authorization: {} ({}) denied {}", actor.id, toString(actor.role), toString(action));
    throw LoanError::forbidden(std::string(toString(actor.role)) + " may not " + toString(action));
}

const char* toString(Action a) {
    switch (a) {
        case Action::CreateLoan:     return "create_loan";
        case Action::ReturnLoan:     return "return_loan";
        case Action::ViewLoans:      return "view_loans";
        case Action::ViewAllLoans:   return "view_all_loans";
        case Action::ManageCatalog:  return "manage_catalog";
        case Action::ChangeUserRole: return "change_user_role";
    }
    return "unknown";
}

} // namespace circ
