#include "floorplan/stairs/stair_geometry.h"
#include "floorplan/units.h"

#include <algorithm>
#include <cmath>
#include <limits>

namespace floorplan {

namespace {

bool isVerticalEntry(WallDirection d) noexcept {
    return d == WallDirection::Top || d == WallDirection::Bottom;
}

double runLength(const std::vector<int>& runs, std::size_t i, double tread) noexcept {
    return i < runs.size() ? runs[i] * tread : 0.0;
}

struct DimensionBuilder {
    StairDimensions& dims;

    void operator()(const StraightStair& s) const {
        dims.direction = s.direction;
        const double run = dims.stepCount * dims.tread;
        if (isVerticalEntry(s.direction)) {
            dims.width = dims.stairWidth;
            dims.height = run;
        } else {
            dims.width = run;
            dims.height = dims.stairWidth;
        }
    }

    void operator()(const LShapedStair& s) const {
        dims.direction = s.entry;
        dims.runs = splitRuns(s.runs, dims.stepCount, 2);
        const double run1 = runLength(dims.runs, 0, dims.tread);
        const double run2 = runLength(dims.runs, 1, dims.tread);
        dims.landingWidth = normalizeLength(s.landing ? std::optional<Length>(s.landing->width) : std::nullopt, dims.stairWidth, dims.unit);
        dims.landingHeight = normalizeLength(s.landing ? std::optional<Length>(s.landing->height) : std::nullopt, dims.landingWidth, dims.unit);
        if (isVerticalEntry(s.entry)) {
            dims.height = run1 + dims.landingHeight;
            dims.width = dims.landingWidth + run2;
        } else {
            dims.width = run1 + dims.landingWidth;
            dims.height = dims.landingHeight + run2;
        }
    }

    void operator()(const UShapedStair& s) const {
        dims.direction = s.entry;
        dims.runs = splitRuns(s.runs, dims.stepCount, 2);
        const double longest = std::max(runLength(dims.runs, 0, dims.tread), runLength(dims.runs, 1, dims.tread));
        dims.landingWidth = normalizeLength(s.landing ? std::optional<Length>(s.landing->width) : std::nullopt, dims.stairWidth * 2.0, dims.unit);
        dims.landingHeight = normalizeLength(s.landing ? std::optional<Length>(s.landing->height) : std::nullopt, dims.stairWidth, dims.unit);
        if (isVerticalEntry(s.entry)) {
            dims.width = dims.landingWidth;
            dims.height = longest + dims.landingHeight;
        } else {
            dims.height = dims.landingWidth;
            dims.width = longest + dims.landingHeight;
        }
    }

    // Three runs joined by two landings turning the same way: up, across, back.
    void operator()(const DoubleLStair& s) const {
        dims.direction = s.entry;
        dims.runs = splitRuns(s.runs, dims.stepCount, 3);
        const double run1 = runLength(dims.runs, 0, dims.tread);
        const double run2 = runLength(dims.runs, 1, dims.tread);
        const double run3 = runLength(dims.runs, 2, dims.tread);
        dims.landingWidth = normalizeLength(s.landing ? std::optional<Length>(s.landing->width) : std::nullopt, dims.stairWidth, dims.unit);
        dims.landingHeight = normalizeLength(s.landing ? std::optional<Length>(s.landing->height) : std::nullopt, dims.landingWidth, dims.unit);
        const double across = 2.0 * dims.landingWidth + run2;
        const double along = dims.landingHeight + std::max(run1, run3);
        if (isVerticalEntry(s.entry)) {
            dims.width = across;
            dims.height = along;
        } else {
            dims.width = along;
            dims.height = across;
        }
    }

    void operator()(const SpiralStair& s) const {
        const double radius = normalizeLength(s.outerRadius, dims.stairWidth / 2.0, dims.unit);
        dims.width = radius * 2.0;
        dims.height = radius * 2.0;
    }

    void operator()(const CurvedStair& s) const {
        dims.direction = s.entry;
        const double radius = normalizeLength(s.radius, dims.stairWidth, dims.unit);
        dims.width = radius * 2.0;
        dims.height = radius * 2.0;
    }

    // L footprint with the landing replaced by a square winder corner.
    void operator()(const WinderStair& s) const {
        dims.direction = s.entry;
        dims.runs = splitRuns(s.runs, dims.stepCount, 2);
        const double run1 = runLength(dims.runs, 0, dims.tread);
        const double run2 = runLength(dims.runs, 1, dims.tread);
        dims.landingWidth = dims.stairWidth;
        dims.landingHeight = dims.stairWidth;
        if (isVerticalEntry(s.entry)) {
            dims.height = run1 + dims.stairWidth;
            dims.width = dims.stairWidth + run2;
        } else {
            dims.width = run1 + dims.stairWidth;
            dims.height = dims.stairWidth + run2;
        }
    }

    void operator()(const SegmentedStair& s) const {
        dims.direction = s.entry;
        dims.width = 0.0;
        dims.height = 0.0;
        for (const StairPart& part : layoutSegmentedStair(s, dims.stairWidth, dims.tread, dims.unit)) {
            dims.width = std::max(dims.width, part.rect.x + part.rect.width);
            dims.height = std::max(dims.height, part.rect.y + part.rect.height);
        }
    }
};

} // namespace

double normalizeLength(const std::optional<Length>& len, double fallback, LengthUnit unit) noexcept {
    if (!len) return fallback;
    return lengthIn(*len, unit);
}

int computeStepCount(double rise, double riser) noexcept {
    if (!(riser > 0.0) || !(rise > 0.0)) return 0;
    return static_cast<int>(std::ceil(rise / riser));
}

std::vector<int> splitRuns(const std::vector<int>& declared, int stepCount, std::size_t parts) {
    if (declared.size() >= parts) return declared;
    std::vector<int> runs(parts, 0);
    const int base = stepCount / static_cast<int>(parts);
    for (std::size_t i = 0; i + 1 < parts; ++i) runs[i] = base;
    runs[parts - 1] = stepCount - base * static_cast<int>(parts - 1);
    return runs;
}

StairDimensions calculateStairDimensions(const Stair& stair, LengthUnit unit) {
    StairDimensions dims;
    dims.unit = unit;
    dims.stairWidth = normalizeLength(stair.width, convertUnit(kDefaultStairWidthFt, LengthUnit::Ft, unit), unit);
    dims.rise = normalizeLength(stair.rise, convertUnit(kDefaultStairRiseFt, LengthUnit::Ft, unit), unit);
    dims.riser = normalizeLength(stair.riser, convertUnit(kStandardRiserIn, LengthUnit::In, unit), unit);
    dims.tread = normalizeLength(stair.tread, convertUnit(kStandardTreadIn, LengthUnit::In, unit), unit);
    dims.stepCount = computeStepCount(dims.rise, dims.riser);
    dims.width = dims.stairWidth;
    dims.height = dims.stepCount * dims.tread;
    std::visit(DimensionBuilder{dims}, stair.shape);
    return dims;
}

ResolvedSize getStairBoundingBox(const Stair& stair, LengthUnit unit) {
    const StairDimensions dims = calculateStairDimensions(stair, unit);
    return ResolvedSize{dims.width, dims.height};
}

WallDirection applyTurn(WallDirection current, TurnDirection turn) noexcept {
    static constexpr WallDirection kOrder[] = {
        WallDirection::Top, WallDirection::Right, WallDirection::Bottom, WallDirection::Left};
    int idx = 0;
    for (int i = 0; i < 4; ++i) {
        if (kOrder[i] == current) idx = i;
    }
    const int delta = turn == TurnDirection::Right ? 1 : -1;
    return kOrder[(idx + delta + 4) % 4];
}

std::vector<StairPart> layoutSegmentedStair(
    const SegmentedStair& shape,
    double stairWidth,
    double tread,
    LengthUnit unit) {
    std::vector<StairPart> parts;
    double cx = 0.0;
    double cy = 0.0;
    WallDirection dir = shape.entry;

    for (const StairSegment& segment : shape.segments) {
        if (const auto* flight = std::get_if<FlightSegment>(&segment)) {
            const double w = normalizeLength(flight->width, stairWidth, unit);
            const double len = flight->steps * tread;
            StairPart part;
            part.kind = StairPart::Kind::Flight;
            part.direction = dir;
            part.steps = flight->steps;
            part.rect = isVerticalEntry(dir) ? Rect{cx, cy, w, len} : Rect{cx, cy, len, w};
            if (dir == WallDirection::Top) part.rect.y = cy - len;
            if (dir == WallDirection::Left) part.rect.x = cx - len;
            parts.push_back(part);

            switch (dir) {
                case WallDirection::Top: cy -= len; break;
                case WallDirection::Bottom: cy += len; break;
                case WallDirection::Right: cx += len; break;
                case WallDirection::Left: cx -= len; break;
            }
            continue;
        }

        const auto& turn = std::get<TurnSegment>(segment);
        const double lw = turn.landing ? lengthIn(turn.landing->width, unit) : stairWidth;
        const double lh = turn.landing ? lengthIn(turn.landing->height, unit) : stairWidth;
        StairPart landing;
        landing.kind = StairPart::Kind::Landing;
        landing.direction = dir;
        landing.rect = Rect{cx, cy, lw, lh};
        if (dir == WallDirection::Top) landing.rect.y = cy - lh;
        if (dir == WallDirection::Left) landing.rect.x = cx - lw;
        parts.push_back(landing);

        dir = applyTurn(dir, turn.direction);
        if (turn.angle && *turn.angle >= 180.0) dir = applyTurn(dir, turn.direction);

        const Rect& r = landing.rect;
        switch (dir) {
            case WallDirection::Top: cx = r.x; cy = r.y; break;
            case WallDirection::Bottom: cx = r.x; cy = r.y + r.height; break;
            case WallDirection::Right: cx = r.x + r.width; cy = r.y; break;
            case WallDirection::Left: cx = r.x; cy = r.y; break;
        }
    }

    if (parts.empty()) return parts;

    double minX = std::numeric_limits<double>::infinity();
    double minY = std::numeric_limits<double>::infinity();
    for (const StairPart& part : parts) {
        minX = std::min(minX, part.rect.x);
        minY = std::min(minY, part.rect.y);
    }
    for (StairPart& part : parts) {
        part.rect.x -= minX;
        part.rect.y -= minY;
    }
    return parts;
}

const char* stairShapeName(const StairShape& shape) noexcept {
    switch (shape.index()) {
        case 0: return "straight";
        case 1: return "L-shaped";
        case 2: return "U-shaped";
        case 3: return "double-L";
        case 4: return "spiral";
        case 5: return "curved";
        case 6: return "winder";
        case 7: return "custom";
    }
    return "straight";
}

} // namespace floorplan
