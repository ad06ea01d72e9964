#include "reckon/anomaly/record.hpp"

#include <ostream>


namespace reckon::anomaly {

// ---------------------------------
// Debug / logging helper
// ---------------------------------

std::ostream& operator<<(std::ostream& os, const AnomalyRecord& a) {
    os << "[Anomaly] {"
       << "type=" << to_string(a.type)
       << ", severity=" << to_string(a.severity)
       << ", ts=" << core::to_string(a.timestamp);

    if (!a.user_id.empty()) {
        os << ", user=" << a.user_id;
    }
    if (!a.transaction_id.empty()) {
        os << ", id=" << a.transaction_id;
    }
    os << ", message=" << a.message;

    for (const auto& d : a.details) {
        os << ", " << d.key << "=" << d.value;
    }

    os << ", related=[";
    for (std::size_t i = 0; i < a.related.size(); ++i) {
        if (i) os << ",";
        os << a.related[i];
    }
    os << "]}";

    return os;
}

} // namespace reckon::anomaly
