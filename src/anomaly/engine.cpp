#include "reckon/anomaly/engine.hpp"

#include <algorithm>
#include <array>
#include <iterator>
#include <tuple>

#include "reckon/core/parallel.hpp"
#include "lcr/log/logger.hpp"


namespace reckon::anomaly {

Anomalies detect_all(const ledger::Ledger& ledger, const config::Engine& cfg) {
    const Context ctx(ledger, cfg);

    std::array<Anomalies, TYPE_COUNT> slots;
    core::parallel_for(DETECTORS.size(), cfg.workers, [&](std::size_t i) {
        slots[i] = DETECTORS[i](ledger, ctx);
    });

    Anomalies merged;
    for (std::size_t i = 0; i < slots.size(); ++i) {
        RK_DEBUG("[ANOMALY] " << to_string(static_cast<Type>(i)) << ": " << slots[i].size() << " records");
        std::move(slots[i].begin(), slots[i].end(), std::back_inserter(merged));
    }

    std::stable_sort(merged.begin(), merged.end(), [](const AnomalyRecord& a, const AnomalyRecord& b) {
        const std::size_t ra = a.related.empty() ? 0 : a.related.front();
        const std::size_t rb = b.related.empty() ? 0 : b.related.front();
        return std::tie(a.timestamp, a.type, ra) < std::tie(b.timestamp, b.type, rb);
    });

    RK_INFO("[ANOMALY] " << merged.size() << " anomalies over " << ledger.size()
            << " ledger entries (" << ctx.users.size() << " users)");
    return merged;
}


void annotate(ledger::Ledger& ledger, const Anomalies& anomalies) {
    for (auto& entry : ledger) {
        entry.anomalies.clear();
    }
    for (std::size_t a = 0; a < anomalies.size(); ++a) {
        for (std::size_t idx : anomalies[a].related) {
            if (idx < ledger.size()) {
                ledger[idx].anomalies.push_back(a);
            } else {
                RK_WARN("[ANOMALY] Anomaly " << a << " references ledger index " << idx
                        << " beyond " << ledger.size() << " entries -> skipped");
            }
        }
    }
}

} // namespace reckon::anomaly
