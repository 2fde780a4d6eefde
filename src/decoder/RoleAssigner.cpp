#include "decoder/RoleAssigner.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>

using namespace mld::domain;

namespace mld::decoder {

namespace {

double round_cents(double v) {
    return std::round(v * 100.0) / 100.0;
}

} // anonymous namespace

PositionalRoleAssigner::PositionalRoleAssigner()
    : roles_{NumericRole::LINE, NumericRole::OVER_PRICE, NumericRole::UNDER_PRICE} {}

PositionalRoleAssigner::PositionalRoleAssigner(std::vector<NumericRole> roles)
    : roles_(std::move(roles)) {}

std::vector<NumericCandidate> PositionalRoleAssigner::assign(
    std::span<const NumericCandidate> window) const {
    std::vector<NumericCandidate> assigned;
    std::size_t n = std::min(window.size(), roles_.size());
    assigned.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        NumericCandidate c = window[i];
        c.role = roles_[i];
        assigned.push_back(c);
    }
    return assigned;
}

std::vector<NumericCandidate> RankedAverageRoleAssigner::assign(
    std::span<const NumericCandidate> window) const {
    if (window.empty()) return {};

    std::vector<NumericCandidate> ranked(window.begin(), window.end());
    for (auto& c : ranked) c.value = round_cents(c.value);

    // Stable so equal values keep buffer order
    std::stable_sort(ranked.begin(), ranked.end(),
                     [](const NumericCandidate& a, const NumericCandidate& b) {
                         return a.value > b.value;
                     });
    if (ranked.size() > kTopCount) ranked.resize(kTopCount);

    for (auto& c : ranked) {
        if (c.value >= kScaledBandLow && c.value <= kScaledBandHigh) {
            c.value = round_cents(c.value / kRankedScaleDivisor);
        }
    }

    double sum = std::accumulate(ranked.begin(), ranked.end(), 0.0,
                                 [](double acc, const NumericCandidate& c) {
                                     return acc + c.value;
                                 });

    std::vector<NumericCandidate> assigned;
    assigned.push_back(NumericCandidate{
        ranked.front().byte_offset,
        round_cents(sum / static_cast<double>(ranked.size())),
        NumericRole::LINE});

    const NumericRole price_roles[] = {NumericRole::OVER_PRICE, NumericRole::UNDER_PRICE};
    for (std::size_t i = 0; i < ranked.size() && i < 2; ++i) {
        NumericCandidate c = ranked[i];
        c.role = price_roles[i];
        assigned.push_back(c);
    }
    return assigned;
}

std::shared_ptr<const IRoleAssigner> make_role_assigner(const std::string& strategy) {
    if (strategy == "positional") return std::make_shared<PositionalRoleAssigner>();
    if (strategy == "ranked_average") return std::make_shared<RankedAverageRoleAssigner>();
    throw std::invalid_argument("Unknown role strategy: " + strategy);
}

} // namespace mld::decoder
