#include "floorplan/render/door_svg.h"
#include "floorplan/core/string_utils.h"

namespace floorplan {

std::string doorLeafPath(const DoorLeaf& leaf) {
    std::string d;
    d += "M " + formatNumber(leaf.hingeX) + " " + formatNumber(leaf.hingeY);
    d += " L " + formatNumber(leaf.panelEndX) + " " + formatNumber(leaf.panelEndY);
    d += " A " + formatNumber(leaf.radius) + " " + formatNumber(leaf.radius) + " 0 0 " + std::to_string(leaf.sweep);
    d += " " + formatNumber(leaf.arcEndX) + " " + formatNumber(leaf.arcEndY);
    return d;
}

static void leafPath(SvgBuilder& svg, const DoorLeaf& leaf) {
    svg.open("path")
        .attr("d", doorLeafPath(leaf))
        .attr("fill", "white")
        .attr("stroke", "black")
        .attr("stroke-width", 0.05);
}

void generateDoor(
    SvgBuilder& svg,
    const Rect& rect,
    WallDirection wall,
    DoorType type,
    std::optional<SwingDirection> swing) {
    switch (type) {
        case DoorType::Opening:
            svg.open("rect")
                .attr("x", rect.x)
                .attr("y", rect.y)
                .attr("width", rect.width)
                .attr("height", rect.height)
                .attr("fill", "white")
                .attr("stroke", "none")
                .attr("class", "opening")
                .attr("data-type", "opening")
                .attr("data-direction", toString(wall))
                .selfClose();
            return;

        case DoorType::DoubleDoor: {
            svg.open("g")
                .attr("class", "double-door")
                .attr("data-type", "double-door")
                .attr("data-direction", toString(wall))
                .close();
            for (const DoorLeaf& leaf : computeDoubleDoorLeaves(rect, wall)) {
                leafPath(svg, leaf);
                svg.selfClose();
            }
            svg.end("g");
            return;
        }

        case DoorType::Door:
            break;
    }

    const DoorLeaf leaf = computeDoorLeafForRect(rect, wall, swing.value_or(SwingDirection::Right));
    leafPath(svg, leaf);
    svg.attr("class", "door")
        .attr("data-type", "door")
        .attr("data-direction", toString(wall))
        .attr("data-swing", swing ? toString(*swing) : "default")
        .selfClose();
}

void generateWindow(SvgBuilder& svg, const Rect& wallRect, WallDirection wall) {
    const Rect glass = computeWindowRect(wallRect);
    svg.open("rect")
        .attr("x", glass.x)
        .attr("y", glass.y)
        .attr("width", glass.width)
        .attr("height", glass.height)
        .attr("class", "window")
        .attr("fill", "white")
        .attr("stroke", "black")
        .attr("stroke-width", 0.01)
        .attr("data-type", "window")
        .attr("data-direction", toString(wall))
        .selfClose();
}

} // namespace floorplan
