#include "reckon/anomaly/detectors.hpp"

#include <algorithm>
#include <cstddef>


namespace reckon::anomaly {

Context::Context(const ledger::Ledger& ledger, const config::Engine& engine)
    : cfg(engine)
{
    for (std::size_t i = 0; i < ledger.size(); ++i) {
        users[ledger[i].event.user_id].push_back(i);
    }
}

double median(std::vector<double> values) {
    const std::size_t n = values.size();
    if (n == 0) {
        return 0.0;
    }
    const std::size_t mid = n / 2;
    std::nth_element(values.begin(), values.begin() + static_cast<std::ptrdiff_t>(mid), values.end());
    const double upper = values[mid];
    if (n % 2 == 1) {
        return upper;
    }
    const double lower = *std::max_element(values.begin(), values.begin() + static_cast<std::ptrdiff_t>(mid));
    return (lower + upper) / 2.0;
}

} // namespace reckon::anomaly
