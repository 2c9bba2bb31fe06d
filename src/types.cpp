#include "circulation/types.hpp"
#include "circulation/errors.hpp"

namespace circ {

const char* toString(Role r) {
    switch (r) {
        case Role::Member:    return "member";
        case Role::Librarian: return "librarian";
        case Role::Admin:     return "admin";
    }
    return "unknown";
}

const char* toString(LoanStatus s) {
    switch (s) {
        case LoanStatus::Active:   return "active";
        case LoanStatus::Returned: return "returned";
    }
    return "unknown";
}

const char* toString(EffectiveStatus s) {
    switch (s) {
        case EffectiveStatus::Active:   return "active";
        case EffectiveStatus::Overdue:  return "overdue";
        case EffectiveStatus::Returned: return "returned";
    }
    return "unknown";
}

Role parseRole(const std::string& s) {
    if (s == "member")    return Role::Member;
    if (s == "librarian") return Role::Librarian;
    if (s == "admin")     return Role::Admin;
    throw LoanError::validation("unknown role '" + s + "'");
}

EffectiveStatus parseStatusFilter(const std::string& s) {
    if (s == "active")   return EffectiveStatus::Active;
    if (s == "returned") return EffectiveStatus::Returned;
    if (s == "overdue")  return EffectiveStatus::Overdue;
    throw LoanError::validation("invalid status filter '" + s + "', use: active, returned, overdue");
}

void validateId(const char* what, const std::string& id) {
    if (id.empty() || id.size() > 64) {
        throw LoanError::validation(std::string(what) + " id must have 1..64 characters");
    }
    for (char ch : id) {
        const bool ok = (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') ||
                        (ch >= '0' && ch <= '9') || ch == '-' || ch == '_';
        if (!ok) throw LoanError::validation(std::string(what) + " id '" + id + "' is malformed");
    }
}

// ----- utils de tiempo -----
Timestamp now_utc() {
    using namespace std::chrono;
    return floor<seconds>(system_clock::now());
}

Timestamp addDays(Timestamp base, int d) {
    return base + std::chrono::days(d);
}

Timestamp makeTime(int y, unsigned m, unsigned d, int hour) {
    using namespace std::chrono;
    return sys_days{year{y}/month{m}/day{d}} + hours(hour);
}

} // namespace circ
