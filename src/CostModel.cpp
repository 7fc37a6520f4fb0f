#include "CostModel.hpp"
#include "NeighborTable.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

double CompositeCostModel::cost(const NeighborInfo &neighbor) const
{
    if (neighbor.quality <= 0.0)
        return std::numeric_limits<double>::infinity();

    double raw = 0.5 * (1.0 / neighbor.quality) +
                 0.3 * (std::fabs(neighbor.signalStrength) / 100.0) +
                 0.2 * (1.0 / (neighbor.bandwidthAvailable + 1.0));
    return std::max(1.0, raw);
}

double InverseQualityCostModel::cost(const NeighborInfo &neighbor) const
{
    if (neighbor.quality <= 0.0)
        return std::numeric_limits<double>::infinity();
    return std::max(1.0, 1.0 / neighbor.quality);
}

std::shared_ptr<const LinkCostModel> makeCostModel(const std::string &name)
{
    if (name == "composite")
        return std::make_shared<CompositeCostModel>();
    if (name == "inverse_quality")
        return std::make_shared<InverseQualityCostModel>();
    if (name == "unit")
        return std::make_shared<UnitCostModel>();
    throw std::invalid_argument("Unknown cost model: " + name);
}
