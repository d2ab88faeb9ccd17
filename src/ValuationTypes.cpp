#include "ValuationTypes.hpp"
#include <cmath>
#include <sstream>

namespace ipvalue {

std::string_view toString(ErrorCode code) noexcept
{
    switch (code) {
        case ErrorCode::DataNotFound:        return "DataNotFound";
        case ErrorCode::InsufficientData:    return "InsufficientData";
        case ErrorCode::InvalidAssumptions:  return "InvalidAssumptions";
        case ErrorCode::ParameterOutOfRange: return "ParameterOutOfRange";
        case ErrorCode::DivisionUndefined:   return "DivisionUndefined";
        case ErrorCode::DataSourceFailure:   return "DataSourceFailure";
    }
    return "Unknown";
}

std::string_view toString(ValuationMethod method) noexcept
{
    switch (method) {
        case ValuationMethod::ReliefFromRoyalty: return "relief_from_royalty";
        case ValuationMethod::ExcessEarnings:    return "excess_earnings";
        case ValuationMethod::TechnologyFactor:  return "technology_factor";
        case ValuationMethod::IncrementalIncome: return "incremental_income";
    }
    return "unknown";
}

std::optional<ValuationMethod> parseValuationMethod(std::string_view name) noexcept
{
    if (name == "relief_from_royalty") return ValuationMethod::ReliefFromRoyalty;
    if (name == "excess_earnings") return ValuationMethod::ExcessEarnings;
    if (name == "technology_factor") return ValuationMethod::TechnologyFactor;
    if (name == "incremental_income") return ValuationMethod::IncrementalIncome;
    return std::nullopt;
}

std::optional<double> SegmentSeries::averageOperatingMargin() const noexcept
{
    if (operatingMargins.empty()) {
        return std::nullopt;
    }

    double sum = 0.0;
    for (double margin : operatingMargins) {
        sum += margin;
    }
    return sum / static_cast<double>(operatingMargins.size());
}

Expected<void> validateAssumptions(const AssumptionSet& assumptions)
{
    auto inUnitRange = [](double v) { return std::isfinite(v) && v >= 0.0 && v <= 1.0; };

    if (!inUnitRange(assumptions.wacc)) {
        std::ostringstream oss;
        oss << "WACC must lie in [0,1], got " << assumptions.wacc;
        return makeError(ErrorCode::InvalidAssumptions, oss.str());
    }

    if (!inUnitRange(assumptions.taxRate)) {
        std::ostringstream oss;
        oss << "Tax rate must lie in [0,1], got " << assumptions.taxRate;
        return makeError(ErrorCode::InvalidAssumptions, oss.str());
    }

    if (!std::isfinite(assumptions.terminalGrowth) ||
        assumptions.terminalGrowth <= -1.0 || assumptions.terminalGrowth >= 1.0) {
        std::ostringstream oss;
        oss << "Terminal growth must lie in (-1,1), got " << assumptions.terminalGrowth;
        return makeError(ErrorCode::InvalidAssumptions, oss.str());
    }

    if (assumptions.wacc <= assumptions.terminalGrowth) {
        std::ostringstream oss;
        oss << "WACC (" << assumptions.wacc << ") must be greater than terminal growth ("
            << assumptions.terminalGrowth << ")";
        return makeError(ErrorCode::InvalidAssumptions, oss.str());
    }

    return {};
}

}  // namespace ipvalue
