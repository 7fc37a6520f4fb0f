#pragma once
#include <memory>
#include <string>

struct NeighborInfo;

class LinkCostModel
{
public:
    virtual ~LinkCostModel() = default;
    virtual double cost(const NeighborInfo &neighbor) const = 0;
    virtual std::string name() const = 0;
};

// max(1, 0.5/quality + 0.3*|signal|/100 + 0.2/(bandwidth+1))
class CompositeCostModel : public LinkCostModel
{
public:
    double cost(const NeighborInfo &neighbor) const override;
    std::string name() const override { return "composite"; }
};

// max(1, 1/quality)
class InverseQualityCostModel : public LinkCostModel
{
public:
    double cost(const NeighborInfo &neighbor) const override;
    std::string name() const override { return "inverse_quality"; }
};

class UnitCostModel : public LinkCostModel
{
public:
    double cost(const NeighborInfo &) const override { return 1.0; }
    std::string name() const override { return "unit"; }
};

// Throws std::invalid_argument for an unknown name.
std::shared_ptr<const LinkCostModel> makeCostModel(const std::string &name);
