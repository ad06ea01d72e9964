#include "reckon/core/enums.hpp"

#include <algorithm>
#include <cctype>
#include <string>


namespace reckon::core {

std::string upper_trimmed(std::string_view sv) {
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front()))) sv.remove_prefix(1);
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back()))) sv.remove_suffix(1);

    std::string out(sv);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    return out;
}

namespace {

// Enum names: upper-case with '-' and ' ' folded to '_'
std::string canonical(std::string_view sv) {
    std::string out = upper_trimmed(sv);
    std::replace_if(out.begin(), out.end(), [](char c) { return c == '-' || c == ' '; }, '_');
    return out;
}

} // namespace


std::string_view to_string(Action a) noexcept {
    switch (a) {
        case Action::Deduct:       return "DEDUCT";
        case Action::Debit:        return "DEBIT";
        case Action::Credit:       return "CREDIT";
        case Action::Adjustment:   return "ADJUSTMENT";
        case Action::Refund:       return "REFUND";
        case Action::TopUp:        return "TOPUP";
        case Action::Reversal:     return "REVERSAL";
        case Action::Invalid:      return "INVALID";
        case Action::Unrecognized: return "UNRECOGNIZED";
        case Action::Missing:      return "MISSING";
    }
    return "unknown";
}

std::string_view to_string(Direction d) noexcept {
    switch (d) {
        case Direction::Credit:      return "CREDIT";
        case Direction::Debit:       return "DEBIT";
        case Direction::Unspecified: return "UNSPECIFIED";
    }
    return "unknown";
}

std::string_view to_string(Overdraft o) noexcept {
    switch (o) {
        case Overdraft::None:     return "NONE";
        case Overdraft::Expected: return "EXPECTED";
        case Overdraft::Actual:   return "ACTUAL";
        case Overdraft::Both:     return "BOTH";
    }
    return "unknown";
}

Action parse_action(std::string_view sv) {
    const std::string a = canonical(sv);
    if (a.empty()) return Action::Missing;

    if (a == "DEDUCT" || a == "DEDUCTION")                 return Action::Deduct;
    if (a == "DEBIT")                                      return Action::Debit;
    if (a == "CREDIT")                                     return Action::Credit;
    if (a == "ADJUSTMENT" || a == "ADJUST")                return Action::Adjustment;
    if (a == "REFUND")                                     return Action::Refund;
    if (a == "TOPUP" || a == "TOP_UP")                     return Action::TopUp;
    if (a == "REVERSAL" || a == "REVERSE")                 return Action::Reversal;

    if (a.find("INVALID") != std::string::npos || a.find("INVAILID") != std::string::npos) {
        return Action::Invalid;
    }
    return Action::Unrecognized;
}

Direction parse_direction(std::string_view sv) {
    const std::string d = canonical(sv);
    if (d == "CREDIT") return Direction::Credit;
    if (d == "DEBIT")  return Direction::Debit;
    return Direction::Unspecified;
}

} // namespace reckon::core
