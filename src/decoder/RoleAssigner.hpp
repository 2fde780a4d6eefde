#pragma once

#include "domain/payload/NumericCandidate.hpp"
#include "domain/value_objects/NumericRole.hpp"

#include <memory>
#include <span>
#include <string>
#include <vector>

namespace mld::decoder {

// Strategy that labels the plausible candidates of one token window.
// Input is in ascending offset order. The returned candidates carry their
// role; any candidate left UNASSIGNED is ignored by the assembler.
class IRoleAssigner {
public:
    virtual std::vector<domain::NumericCandidate> assign(
        std::span<const domain::NumericCandidate> window) const = 0;
    virtual ~IRoleAssigner() = default;
};

// The n-th candidate in the window gets the n-th role. Roles without a
// candidate stay absent.
class PositionalRoleAssigner : public IRoleAssigner {
public:
    PositionalRoleAssigner();
    explicit PositionalRoleAssigner(std::vector<domain::NumericRole> roles);

    std::vector<domain::NumericCandidate> assign(
        std::span<const domain::NumericCandidate> window) const override;

    const std::vector<domain::NumericRole>& roles() const noexcept { return roles_; }

private:
    std::vector<domain::NumericRole> roles_;
};

// Legacy heuristic: the three largest values (rounded to cents), with mid-range
// values divided by kRankedScaleDivisor, become over then under; their mean
// becomes the line.
class RankedAverageRoleAssigner : public IRoleAssigner {
public:
    static constexpr double kRankedScaleDivisor = 3.5;
    static constexpr double kScaledBandLow = 10.0;
    static constexpr double kScaledBandHigh = 100.0;
    static constexpr std::size_t kTopCount = 3;

    std::vector<domain::NumericCandidate> assign(
        std::span<const domain::NumericCandidate> window) const override;
};

// "positional" or "ranked_average". Throws std::invalid_argument otherwise.
std::shared_ptr<const IRoleAssigner> make_role_assigner(const std::string& strategy);

} // namespace mld::decoder
