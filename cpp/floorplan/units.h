#ifndef FLOORPLAN_UNITS_H
#define FLOORPLAN_UNITS_H

#include "floorplan/types.h"
#include <optional>
#include <set>
#include <string_view>

namespace floorplan {

enum class UnitSystem : std::uint8_t { Metric = 0, Imperial = 1 };

constexpr LengthUnit kDefaultUnit = LengthUnit::M;

double toMeters(double value, LengthUnit unit) noexcept;
double fromMeters(double meters, LengthUnit unit) noexcept;

// Exact multiplicative conversion through meters. Identity when from == to.
double convertUnit(double value, LengthUnit from, LengthUnit to) noexcept;

// explicit ?? configDefault ?? m
LengthUnit resolveUnit(std::optional<LengthUnit> explicitUnit, std::optional<LengthUnit> configDefault) noexcept;

std::optional<LengthUnit> parseLengthUnit(std::string_view s) noexcept;

bool isMetric(LengthUnit u) noexcept;
bool isImperial(LengthUnit u) noexcept;
UnitSystem unitSystemOf(LengthUnit u) noexcept;

// Value of `len` expressed in `target`; a unitless value is taken to be in `target` already.
double lengthIn(const Length& len, LengthUnit target) noexcept;

// Every unit suffix used by dimensioned values in the document.
std::set<LengthUnit> collectUnits(const Floorplan& floorplan);
std::set<UnitSystem> getUnitSystems(const Floorplan& floorplan);
bool hasMixedUnitSystems(const Floorplan& floorplan);

} // namespace floorplan

#endif // FLOORPLAN_UNITS_H
