/// @file src/carry/curve_cache.cpp
/// @brief CurveSnapshotCache: previous-cycle curves keyed by identifier and time.

#include "rvcurve/carry.hpp"

#include <iterator>

namespace rvcurve::carry {

void CurveSnapshotCache::store(curve::YieldCurve curve) {
    const std::int64_t as_of = curve.as_of();
    auto& by_time = snapshots_[curve.identifier()];
    by_time.insert_or_assign(as_of, std::move(curve));
}

const curve::YieldCurve*
CurveSnapshotCache::latest(std::string_view identifier) const noexcept {
    const auto it = snapshots_.find(identifier);
    if (it == snapshots_.end() || it->second.empty()) {
        return nullptr;
    }
    return &it->second.rbegin()->second;
}

const curve::YieldCurve*
CurveSnapshotCache::latest_before(std::string_view identifier,
                                  std::int64_t as_of) const noexcept {
    const auto it = snapshots_.find(identifier);
    if (it == snapshots_.end()) {
        return nullptr;
    }
    const auto& by_time = it->second;
    auto upper = by_time.lower_bound(as_of);
    if (upper == by_time.begin()) {
        return nullptr;
    }
    --upper;
    return &upper->second;
}

const curve::YieldCurve*
CurveSnapshotCache::find(std::string_view identifier, std::int64_t as_of) const noexcept {
    const auto it = snapshots_.find(identifier);
    if (it == snapshots_.end()) {
        return nullptr;
    }
    const auto snap = it->second.find(as_of);
    return snap == it->second.end() ? nullptr : &snap->second;
}

std::size_t CurveSnapshotCache::evict_before(std::int64_t as_of) {
    std::size_t removed = 0;
    for (auto it = snapshots_.begin(); it != snapshots_.end();) {
        auto& by_time = it->second;
        const auto cut = by_time.lower_bound(as_of);
        removed += static_cast<std::size_t>(std::distance(by_time.begin(), cut));
        by_time.erase(by_time.begin(), cut);
        it = by_time.empty() ? snapshots_.erase(it) : std::next(it);
    }
    return removed;
}

std::size_t CurveSnapshotCache::size() const noexcept {
    std::size_t n = 0;
    for (const auto& [id, by_time] : snapshots_) {
        n += by_time.size();
    }
    return n;
}

} // namespace rvcurve::carry
