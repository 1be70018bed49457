#ifndef FLOORPLAN_PIPELINE_H
#define FLOORPLAN_PIPELINE_H

#include "floorplan/model.h"
#include "floorplan/export/json_export.h"
#include "floorplan/render/render_options.h"
#include "floorplan/render/svg_renderer.h"

#include <string>
#include <vector>

namespace floorplan {

/**
 * Run every resolver over `floorplan` once.
 *
 * Version and deprecations, variables and size references, config, theme,
 * styles, per-floor positions, then the advisory checks. Errors and warnings
 * from all stages are gathered on the model; nothing here throws for bad input.
 * The model keeps a pointer to `floorplan`, so temporaries are rejected.
 */
ResolvedModel resolveModel(const Floorplan& floorplan);
ResolvedModel resolveModel(Floorplan&&) = delete;

struct ConversionResult {
    Json json;
    std::string svg;
    std::vector<ResolutionError> errors;
    std::vector<JsonExportError> exportErrors; // floors left out of the JSON
    std::vector<std::string> versionErrors;
    std::vector<Warning> warnings;

    bool ok() const noexcept { return errors.empty() && versionErrors.empty(); }
};

// Resolve once, then emit JSON and SVG from the same model.
ConversionResult convertFloorplan(const Floorplan& floorplan, const RenderOptions& options = RenderOptions{});

} // namespace floorplan

#endif // FLOORPLAN_PIPELINE_H
