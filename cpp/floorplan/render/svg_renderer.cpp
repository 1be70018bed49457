#include "floorplan/render/svg_renderer.h"
#include "floorplan/core/logging.h"
#include "floorplan/core/string_utils.h"
#include "floorplan/render/dimension_svg.h"
#include "floorplan/render/floor_svg.h"
#include "floorplan/render/room_svg.h"
#include "floorplan/render/stair_svg.h"
#include "floorplan/render/svg_builder.h"

#include <algorithm>
#include <vector>

namespace floorplan {

namespace {

const style::ThemeOptions& themeFor(const ResolvedModel& model, const RenderOptions& options) {
    return options.theme ? *options.theme : model.theme;
}

FloorScene sceneFor(const ResolvedModel& model, std::size_t index) {
    return FloorScene{
        model.floorplan->floors[index],
        model.positions[index].second.positions,
        model.variables.variables,
        model.styles,
        model.config.defaultUnit,
        model.config.showLabels};
}

void openDocument(
    SvgBuilder& svg,
    const std::string& viewBox,
    double width,
    double height,
    const RenderOptions& options,
    const style::ThemeOptions& theme) {
    if (options.includeXmlDeclaration) {
        svg.raw("<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n");
    }

    svg.open("svg").attr("viewBox", viewBox).attr("xmlns", "http://www.w3.org/2000/svg");
    if (width != 0.0 && height != 0.0) {
        svg.attr("width", width).attr("height", height);
    }
    svg.attr("role", "img").attr("aria-roledescription", "floorplan").close();

    // Arrowhead used by spiral stair rotation arrows.
    svg.open("defs").close();
    svg.open("marker")
        .attr("id", "arrowhead")
        .attr("markerWidth", 10)
        .attr("markerHeight", 7)
        .attr("refX", 9)
        .attr("refY", 3.5)
        .attr("orient", "auto")
        .close();
    svg.open("polygon").attr("points", "0 0, 10 3.5, 0 7").attr("fill", "#666").selfClose();
    svg.end("marker").end("defs");

    if (options.includeStyles) {
        svg.open("style").close().raw(style::getStyles(theme)).end("style");
    }
}

std::string viewBoxString(double x, double y, double w, double h) {
    return formatNumber(x) + " " + formatNumber(y) + " " + formatNumber(w) + " " + formatNumber(h);
}

void renderFloorContents(
    SvgBuilder& svg,
    const ResolvedModel& model,
    const FloorScene& scene,
    const FloorBounds& bounds,
    const RenderOptions& options) {
    generateFloorRectangle(svg, bounds);
    for (const Room& room : scene.floor.rooms) {
        generateRoomSvg(svg, room, 0.0, 0.0, scene);
    }

    generateConnections(svg, scene, model.floorplan->connections);
    generateFloorCirculation(svg, scene);

    // Labels go on top of stairs and lifts.
    RoomTextOptions text;
    text.showLabels = scene.showLabels;
    text.showArea = options.showArea;
    text.areaUnit = options.areaUnit;
    generateRoomLabels(svg, scene.floor.rooms, 0.0, 0.0, scene, text);

    if (options.showDimensions.value_or(model.config.showDimensions)) {
        DimensionStyle dims;
        dims.types = options.dimensionTypes;
        dims.lengthUnit = options.lengthUnit;
        generateFloorDimensions(svg, scene, dims);
    }
}

struct FloorSlot {
    std::size_t index;
    FloorBounds bounds;
    double offsetX{0.0};
    double offsetY{0.0};
};

} // namespace

std::string renderFloorSvg(const ResolvedModel& model, std::size_t floorIndex, const RenderOptions& options) {
    if (floorIndex >= model.floorplan->floors.size()) return kEmptySvg;

    const FloorScene scene = sceneFor(model, floorIndex);
    const FloorBounds bounds = calculateFloorBounds(scene);
    const double padding = options.padding;
    const double summaryHeight = options.showFloorSummary ? kSummaryPanelSpace : 0.0;

    const double viewW = bounds.width + padding * 2.0;
    const double viewH = bounds.height + padding * 2.0 + summaryHeight;

    SvgBuilder svg;
    openDocument(svg, viewBoxString(bounds.minX - padding, bounds.minY - padding, viewW, viewH),
        viewW * options.scale, viewH * options.scale, options, themeFor(model, options));

    svg.open("g").attr("class", "floorplan").attr("aria-label", "Floor: " + scene.floor.id).close();
    if (!scene.floor.rooms.empty()) {
        renderFloorContents(svg, model, scene, bounds, options);
        if (options.showFloorSummary) {
            generateFloorSummaryPanel(svg, computeFloorMetricsFor(model, floorIndex), bounds, 0.0, 0.0, options.areaUnit);
        }
    }
    svg.end("g").end("svg");
    return svg.release();
}

std::string renderAllFloorsSvg(const ResolvedModel& model, const RenderOptions& options) {
    const std::size_t floorCount = model.floorplan->floors.size();
    const double padding = options.padding;
    const double summaryHeight = options.showFloorSummary ? kSummaryPanelSpace : 0.0;
    const bool stacked = options.multiFloorLayout == MultiFloorLayout::Stacked;

    std::vector<FloorSlot> slots;
    slots.reserve(floorCount);
    for (std::size_t i = 0; i < floorCount; ++i) {
        slots.push_back(FloorSlot{i, calculateFloorBounds(sceneFor(model, i)), 0.0, 0.0});
    }
    // Stacked plans put the first floor at the bottom.
    if (stacked) std::reverse(slots.begin(), slots.end());

    double cursor = 0.0;
    double totalWidth = 0.0;
    double totalHeight = 0.0;
    for (FloorSlot& slot : slots) {
        const FloorBounds& b = slot.bounds;
        if (stacked) {
            slot.offsetX = -b.minX;
            slot.offsetY = cursor - b.minY + kFloorLabelHeight;
            cursor += b.height + kFloorLabelHeight + summaryHeight + kFloorGap;
            totalWidth = std::max(totalWidth, b.width);
            totalHeight = cursor - kFloorGap;
        } else {
            slot.offsetX = cursor - b.minX;
            slot.offsetY = kFloorLabelHeight - b.minY;
            cursor += b.width + kFloorGap;
            totalWidth = cursor - kFloorGap;
            totalHeight = std::max(totalHeight, b.height + kFloorLabelHeight + summaryHeight);
        }
    }

    const double viewW = totalWidth + padding * 2.0;
    const double viewH = totalHeight + padding * 2.0;

    SvgBuilder svg;
    openDocument(svg, viewBoxString(-padding, -padding, viewW, viewH),
        viewW * options.scale, viewH * options.scale, options, themeFor(model, options));
    svg.open("g").attr("class", "floorplan").close();

    for (const FloorSlot& slot : slots) {
        const FloorScene scene = sceneFor(model, slot.index);
        const FloorBounds& b = slot.bounds;

        svg.open("text")
            .attr("x", slot.offsetX + b.minX + b.width / 2.0)
            .attr("y", slot.offsetY + b.minY - 0.5)
            .attr("text-anchor", "middle")
            .attr("class", "floor-label")
            .attr("font-size", 1.2)
            .attr("font-weight", "bold")
            .attr("fill", "black")
            .textElement("text", scene.floor.id);

        const std::string transform = "translate(" + formatNumber(slot.offsetX) + ", " + formatNumber(slot.offsetY) + ")";
        svg.open("g")
            .attr("class", "floor")
            .attr("aria-label", "Floor: " + scene.floor.id)
            .attr("transform", transform)
            .close();
        renderFloorContents(svg, model, scene, b, options);
        svg.end("g");

        // Floors that failed to resolve have no metrics to summarize.
        if (options.showFloorSummary && model.positions[slot.index].second.errors.empty()) {
            generateFloorSummaryPanel(svg, computeFloorMetricsFor(model, slot.index), b,
                slot.offsetX, slot.offsetY, options.areaUnit);
        }
    }

    svg.end("g").end("svg");
    return svg.release();
}

std::string renderSvg(const ResolvedModel& model, const RenderOptions& options) {
    const std::size_t floorCount = model.floorplan->floors.size();
    if (floorCount == 0) return kEmptySvg;

    if (options.renderAllFloors && floorCount > 1) {
        FLOORPLAN_LOG_DEBUG("rendering %zu floors (%s)", floorCount,
            options.multiFloorLayout == MultiFloorLayout::Stacked ? "stacked" : "side by side");
        return renderAllFloorsSvg(model, options);
    }
    return renderFloorSvg(model, options.floorIndex, options);
}

} // namespace floorplan
