#ifndef FLOORPLAN_SVG_RENDERER_H
#define FLOORPLAN_SVG_RENDERER_H

#include "floorplan/model.h"
#include "floorplan/render/render_options.h"

#include <string>

namespace floorplan {

constexpr const char* kEmptySvg = "<svg xmlns=\"http://www.w3.org/2000/svg\"></svg>";

// Multi-floor layout spacing.
constexpr double kFloorGap = 5.0;
constexpr double kFloorLabelHeight = 2.0;
constexpr double kSummaryPanelSpace = 4.0;

/**
 * Render a resolved model.
 *
 * Draws the floor at `options.floorIndex`, or every floor side by side or
 * stacked when `renderAllFloors` is set and there is more than one floor.
 * Returns kEmptySvg for a document without floors or an out-of-range index.
 */
std::string renderSvg(const ResolvedModel& model, const RenderOptions& options = RenderOptions{});

std::string renderFloorSvg(const ResolvedModel& model, std::size_t floorIndex, const RenderOptions& options);

std::string renderAllFloorsSvg(const ResolvedModel& model, const RenderOptions& options);

} // namespace floorplan

#endif // FLOORPLAN_SVG_RENDERER_H
