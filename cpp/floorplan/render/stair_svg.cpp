#include "floorplan/render/stair_svg.h"
#include "floorplan/core/logging.h"
#include "floorplan/core/string_utils.h"
#include "floorplan/units.h"

#include <algorithm>
#include <cmath>

namespace floorplan {

namespace {

constexpr double kPi = 3.14159265358979323846;
constexpr int kSpiralTreads = 12;
constexpr double kLabelFontSize = 0.4;

struct LLayout {
    Rect leg1;
    Rect landing;
    Rect leg2;
};

// Leg 1 leaves the entry side, the landing sits in the far corner, and
// leg 2 runs off the landing toward the turn side.
LLayout layoutLShape(WallDirection entry, TurnDirection turn, double w, double h, double lw, double lh) {
    const bool right = turn == TurnDirection::Right;
    LLayout l;
    l.landing.width = lw;
    l.landing.height = lh;

    switch (entry) {
        case WallDirection::Bottom:
            l.leg1 = Rect{right ? 0.0 : w - lw, lh, lw, h - lh};
            l.landing.x = right ? 0.0 : w - lw;
            l.landing.y = 0.0;
            l.leg2 = Rect{right ? lw : 0.0, 0.0, w - lw, lh};
            break;
        case WallDirection::Top:
            l.leg1 = Rect{right ? w - lw : 0.0, 0.0, lw, h - lh};
            l.landing.x = right ? w - lw : 0.0;
            l.landing.y = h - lh;
            l.leg2 = Rect{right ? 0.0 : lw, h - lh, w - lw, lh};
            break;
        case WallDirection::Left:
            l.leg1 = Rect{0.0, right ? 0.0 : h - lh, w - lw, lh};
            l.landing.x = w - lw;
            l.landing.y = l.leg1.y;
            l.leg2 = Rect{w - lw, right ? lh : 0.0, lw, h - lh};
            break;
        case WallDirection::Right:
            l.leg1 = Rect{lw, right ? h - lh : 0.0, w - lw, lh};
            l.landing.x = 0.0;
            l.landing.y = l.leg1.y;
            l.leg2 = Rect{0.0, right ? 0.0 : lh, lw, h - lh};
            break;
    }
    return l;
}

bool nearlyEqual(double a, double b) {
    return std::abs(a - b) < 1e-9;
}

class StairPainter {
public:
    StairPainter(SvgBuilder& svg, const StairDimensions& dims, const CirculationStyle& style)
        : svg_(svg), dims_(dims), style_(style) {}

    void operator()(const StraightStair&) const { straight(); }

    void operator()(const LShapedStair& s) const { lShape(s.entry, s.turn); }

    void operator()(const UShapedStair&) const {
        const double w = dims_.width;
        const double h = dims_.height;
        const double runWidth = w * 0.4;
        const double landingDepth = h * 0.3;

        rect(Rect{0.0, 0.0, runWidth, h});
        rect(Rect{w - runWidth, 0.0, runWidth, h});
        rect(Rect{runWidth, 0.0, w - 2.0 * runWidth, landingDepth});

        const int stepsPerRun = firstRun();
        if (stepsPerRun > 0) {
            const double spacing = (h - landingDepth) / stepsPerRun;
            for (int i = 1; i < stepsPerRun; ++i) {
                const double y = landingDepth + i * spacing;
                tread(0.0, y, runWidth, y);
                tread(w - runWidth, y, w, y);
            }
        }

        const double ax = runWidth / 2.0;
        const double ay = h * 0.5;
        svg_.open("polygon")
            .attr("points", formatPoint(ax, ay) + " " + formatPoint(ax - 0.15, ay + 0.2) + " " + formatPoint(ax + 0.15, ay + 0.2))
            .attr("fill", style_.strokeColor)
            .selfClose();
    }

    void operator()(const DoubleLStair&) const {
        const double section = dims_.height / 3.0;
        rect(Rect{0.0, 0.0, dims_.width, section});
        rect(Rect{0.0, section, dims_.width * 0.6, section});
        rect(Rect{0.0, section * 2.0, dims_.width, section});
    }

    void operator()(const SpiralStair& s) const {
        const double cx = dims_.width / 2.0;
        const double cy = dims_.height / 2.0;
        const double outerR = std::min(dims_.width, dims_.height) / 2.0;
        const double innerR = s.innerRadius ? lengthIn(*s.innerRadius, dims_.unit) : outerR * 0.3;

        circle(cx, cy, outerR, style_.fillColor);
        circle(cx, cy, innerR, "#fff");

        for (int i = 0; i < kSpiralTreads; ++i) {
            const double a = (i * 360.0 / kSpiralTreads) * kPi / 180.0;
            tread(cx + innerR * std::cos(a), cy + innerR * std::sin(a),
                cx + outerR * std::cos(a), cy + outerR * std::sin(a));
        }

        const bool clockwise = s.rotation == Rotation::Clockwise;
        const double arrowR = (innerR + outerR) / 2.0;
        const double start = (clockwise ? 45.0 : 135.0) * kPi / 180.0;
        const double end = (clockwise ? 135.0 : 45.0) * kPi / 180.0;
        const std::string d = "M " + formatNumber(cx + arrowR * std::cos(start)) + " "
            + formatNumber(cy + arrowR * std::sin(start)) + " A " + formatNumber(arrowR) + " "
            + formatNumber(arrowR) + " 0 0 " + (clockwise ? "1" : "0") + " "
            + formatNumber(cx + arrowR * std::cos(end)) + " " + formatNumber(cy + arrowR * std::sin(end));
        svg_.open("path")
            .attr("d", d)
            .attr("fill", "none")
            .attr("stroke", style_.strokeColor)
            .attr("stroke-width", style_.strokeWidth * 2.0)
            .attr("marker-end", "url(#arrowhead)")
            .selfClose();
    }

    // Plan view of a curved flight uses the straight symbol.
    void operator()(const CurvedStair&) const { straight(); }

    void operator()(const WinderStair& s) const {
        lShape(s.entry, s.turn);

        const double size = std::min(dims_.width, dims_.height) * 0.4;
        const int winders = s.winders > 0 ? s.winders : 3;
        for (int i = 0; i < winders; ++i) {
            const double a = (i + 1) * (90.0 / (winders + 1)) * kPi / 180.0;
            tread(0.0, size, size * std::cos(a), size - size * std::sin(a));
        }
    }

    void operator()(const SegmentedStair& s) const {
        for (const StairPart& part : layoutSegmentedStair(s, dims_.stairWidth, dims_.tread, dims_.unit)) {
            rect(part.rect);
            if (part.kind != StairPart::Kind::Flight || part.steps <= 0) continue;

            const Rect& r = part.rect;
            if (part.direction == WallDirection::Top || part.direction == WallDirection::Bottom) {
                const double spacing = r.height / part.steps;
                for (int i = 1; i < part.steps; ++i) {
                    tread(r.x, r.y + i * spacing, r.x + r.width, r.y + i * spacing);
                }
            } else {
                const double spacing = r.width / part.steps;
                for (int i = 1; i < part.steps; ++i) {
                    tread(r.x + i * spacing, r.y, r.x + i * spacing, r.y + r.height);
                }
            }
        }
    }

private:
    int firstRun() const {
        return dims_.runs.empty() ? dims_.stepCount / 2 : dims_.runs[0];
    }

    int secondRun(int first) const {
        return dims_.runs.size() > 1 ? dims_.runs[1] : dims_.stepCount - first;
    }

    void rect(const Rect& r) const {
        svg_.open("rect")
            .attr("x", r.x)
            .attr("y", r.y)
            .attr("width", r.width)
            .attr("height", r.height)
            .attr("fill", style_.fillColor)
            .attr("stroke", style_.strokeColor)
            .attr("stroke-width", style_.strokeWidth)
            .selfClose();
    }

    void tread(double x1, double y1, double x2, double y2) const {
        svg_.open("line")
            .attr("x1", x1)
            .attr("y1", y1)
            .attr("x2", x2)
            .attr("y2", y2)
            .attr("stroke", style_.strokeColor)
            .attr("stroke-width", style_.strokeWidth * 0.5)
            .selfClose();
    }

    void circle(double cx, double cy, double r, const std::string& fill) const {
        svg_.open("circle")
            .attr("cx", cx)
            .attr("cy", cy)
            .attr("r", r)
            .attr("fill", fill)
            .attr("stroke", style_.strokeColor)
            .attr("stroke-width", style_.strokeWidth)
            .selfClose();
    }

    void straight() const {
        const double w = dims_.width;
        const double h = dims_.height;
        const int n = dims_.stepCount;
        rect(Rect{0.0, 0.0, w, h});

        const WallDirection dir = dims_.direction;
        std::string points;
        if (dir == WallDirection::Top || dir == WallDirection::Bottom) {
            for (int i = 1; i < n; ++i) {
                const double y = i * (h / n);
                tread(0.0, y, w, y);
            }
            const double cx = w / 2.0;
            const double cy = h / 2.0;
            const double len = h * 0.4;
            const double sign = dir == WallDirection::Top ? -1.0 : 1.0;
            const double y1 = cy - sign * len / 2.0;
            const double y2 = cy + sign * len / 2.0;
            arrowShaft(cx, y1, cx, y2);
            const double head = std::min(0.3, w * 0.15);
            points = formatPoint(cx, y2) + " " + formatPoint(cx - head, y2 - head * sign) + " "
                + formatPoint(cx + head, y2 - head * sign);
        } else {
            for (int i = 1; i < n; ++i) {
                const double x = i * (w / n);
                tread(x, 0.0, x, h);
            }
            const double cx = w / 2.0;
            const double cy = h / 2.0;
            const double len = w * 0.4;
            const double sign = dir == WallDirection::Left ? -1.0 : 1.0;
            const double x1 = cx - sign * len / 2.0;
            const double x2 = cx + sign * len / 2.0;
            arrowShaft(x1, cy, x2, cy);
            const double head = std::min(0.3, h * 0.15);
            points = formatPoint(x2, cy) + " " + formatPoint(x2 - head * sign, cy - head) + " "
                + formatPoint(x2 - head * sign, cy + head);
        }
        svg_.open("polygon").attr("points", points).attr("fill", style_.strokeColor).selfClose();
    }

    void arrowShaft(double x1, double y1, double x2, double y2) const {
        svg_.open("line")
            .attr("x1", x1)
            .attr("y1", y1)
            .attr("x2", x2)
            .attr("y2", y2)
            .attr("stroke", style_.strokeColor)
            .attr("stroke-width", style_.strokeWidth * 2.0)
            .selfClose();
    }

    void lShape(WallDirection entry, TurnDirection turn) const {
        const LLayout l = layoutLShape(entry, turn, dims_.width, dims_.height, dims_.landingWidth, dims_.landingHeight);
        rect(l.leg1);
        rect(l.landing);
        rect(l.leg2);

        const int steps1 = firstRun();
        if (steps1 > 0) {
            if (entry == WallDirection::Top || entry == WallDirection::Bottom) {
                const double spacing = l.leg1.height / steps1;
                for (int i = 1; i < steps1; ++i) {
                    const double y = entry == WallDirection::Bottom
                        ? l.leg1.y + l.leg1.height - i * spacing
                        : l.leg1.y + i * spacing;
                    tread(l.leg1.x, y, l.leg1.x + l.leg1.width, y);
                }
            } else {
                const double spacing = l.leg1.width / steps1;
                for (int i = 1; i < steps1; ++i) {
                    const double x = entry == WallDirection::Right
                        ? l.leg1.x + l.leg1.width - i * spacing
                        : l.leg1.x + i * spacing;
                    tread(x, l.leg1.y, x, l.leg1.y + l.leg1.height);
                }
            }
        }

        const int steps2 = secondRun(steps1);
        if (steps2 > 0) {
            const Rect& r = l.leg2;
            if (r.width > r.height) {
                const double spacing = r.width / steps2;
                const bool fromLeft = nearlyEqual(r.x, l.landing.x + l.landing.width);
                for (int i = 1; i <= steps2; ++i) {
                    const double x = fromLeft ? r.x + i * spacing : r.x + r.width - i * spacing;
                    tread(x, r.y, x, r.y + r.height);
                }
            } else {
                const double spacing = r.height / steps2;
                const bool fromTop = nearlyEqual(r.y, l.landing.y + l.landing.height);
                for (int i = 1; i <= steps2; ++i) {
                    const double y = fromTop ? r.y + i * spacing : r.y + r.height - i * spacing;
                    tread(r.x, y, r.x + r.width, y);
                }
            }
        }

        svg_.open("circle")
            .attr("cx", l.leg1.x + l.leg1.width / 2.0)
            .attr("cy", l.leg1.y + l.leg1.height / 2.0)
            .attr("r", std::min(l.leg1.width, l.leg1.height) * 0.2)
            .attr("fill", style_.strokeColor)
            .selfClose();
    }

    SvgBuilder& svg_;
    const StairDimensions& dims_;
    const CirculationStyle& style_;
};

std::string translate(double x, double y) {
    return "translate(" + formatNumber(x) + ", " + formatNumber(y) + ")";
}

void circulationLabel(SvgBuilder& svg, double width, double height, const std::string& label) {
    svg.open("text")
        .attr("x", width / 2.0)
        .attr("y", height + 0.5)
        .attr("text-anchor", "middle")
        .attr("font-size", kLabelFontSize)
        .attr("fill", "#333")
        .textElement("text", stripQuotes(label));
}

} // namespace

void generateStairShapeSvg(
    SvgBuilder& svg,
    const StairShape& shape,
    const StairDimensions& dims,
    const CirculationStyle& style) {
    std::visit(StairPainter{svg, dims, style}, shape);
}

void generateStairSvg(SvgBuilder& svg, const Stair& stair, const FloorScene& scene, const CirculationStyle& style) {
    const double x = stair.position ? stair.position->x.value : 0.0;
    const double y = stair.position ? stair.position->y.value : 0.0;
    const StairDimensions dims = calculateStairDimensions(stair, scene.defaultUnit);
    FLOORPLAN_LOG_DEBUG("stair %s: %s, %d steps, %gx%g",
        stair.name.c_str(), stairShapeName(stair.shape), dims.stepCount, dims.width, dims.height);

    svg.open("g").attr("class", "stair").attr("data-name", stair.name).attr("transform", translate(x, y)).close();
    generateStairShapeSvg(svg, stair.shape, dims, style);
    if (scene.showLabels && stair.label) {
        circulationLabel(svg, dims.width, dims.height, *stair.label);
    }
    svg.end("g");
}

void generateLiftSvg(SvgBuilder& svg, const Lift& lift, const FloorScene& scene, const CirculationStyle& style) {
    const double x = lift.position ? lift.position->x.value : 0.0;
    const double y = lift.position ? lift.position->y.value : 0.0;
    const double w = lift.size.width.value;
    const double h = lift.size.height.value;

    svg.open("g").attr("class", "lift").attr("data-name", lift.name).attr("transform", translate(x, y)).close();

    svg.open("rect")
        .attr("x", 0.0)
        .attr("y", 0.0)
        .attr("width", w)
        .attr("height", h)
        .attr("fill", style.fillColor)
        .attr("stroke", style.strokeColor)
        .attr("stroke-width", style.strokeWidth)
        .selfClose();
    svg.open("line").attr("x1", 0.0).attr("y1", 0.0).attr("x2", w).attr("y2", h)
        .attr("stroke", style.strokeColor).attr("stroke-width", style.strokeWidth).selfClose();
    svg.open("line").attr("x1", w).attr("y1", 0.0).attr("x2", 0.0).attr("y2", h)
        .attr("stroke", style.strokeColor).attr("stroke-width", style.strokeWidth).selfClose();

    for (const WallDirection side : lift.doors) {
        const Rect door = computeLiftDoorRect(side, w, h);
        svg.open("rect")
            .attr("x", door.x)
            .attr("y", door.y)
            .attr("width", door.width)
            .attr("height", door.height)
            .attr("fill", style.strokeColor)
            .selfClose();
    }

    svg.open("text")
        .attr("x", w / 2.0)
        .attr("y", h / 2.0 + 0.15)
        .attr("text-anchor", "middle")
        .attr("font-size", 0.6)
        .attr("font-weight", "bold")
        .attr("fill", style.strokeColor)
        .textElement("text", "E");

    if (scene.showLabels && lift.label) {
        circulationLabel(svg, w, h, *lift.label);
    }
    svg.end("g");
}

void generateFloorCirculation(SvgBuilder& svg, const FloorScene& scene, const CirculationStyle& style) {
    svg.open("g").attr("class", "floor-circulation").attr("aria-label", "Circulation elements").close();
    for (const Stair& stair : scene.floor.stairs) {
        generateStairSvg(svg, stair, scene, style);
    }
    for (const Lift& lift : scene.floor.lifts) {
        generateLiftSvg(svg, lift, scene, style);
    }
    svg.end("g");
}

} // namespace floorplan
