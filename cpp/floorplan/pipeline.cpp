#include "floorplan/pipeline.h"
#include "floorplan/core/logging.h"
#include "floorplan/validation/validator.h"
#include "floorplan/version/deprecation_registry.h"

#include <iterator>

namespace floorplan {

namespace {

template <typename T>
void appendAll(std::vector<T>& dst, const std::vector<T>& src) {
    dst.insert(dst.end(), src.begin(), src.end());
}

} // namespace

ResolvedModel resolveModel(const Floorplan& floorplan) {
    ResolvedModel model;
    model.floorplan = &floorplan;

    model.version = resolveVersion(floorplan.version);
    for (const std::string& msg : model.version.warnings) {
        model.warnings.push_back(Warning{WarningKind::Version, "version", msg});
    }
    appendAll(model.versionErrors, model.version.errors);

    DeprecationReport deprecations = checkDeprecatedConfig(floorplan, model.version.version);
    appendAll(model.warnings, deprecations.warnings);
    appendAll(model.versionErrors, deprecations.errors);

    model.variables = resolveVariables(floorplan);
    appendAll(model.errors, model.variables.errors);
    appendAll(model.errors, validateSizeReferences(floorplan, model.variables.variables));

    model.config = resolveConfig(floorplan);
    model.theme = style::resolveThemeOptions(model.config);
    model.styles = style::buildStyleContext(floorplan);

    model.positions = resolveAllPositions(floorplan, model.variables.variables);
    for (const auto& [floorId, resolution] : model.positions) {
        appendAll(model.errors, resolution.errors);
        for (const OverlapWarning& overlap : resolution.warnings) {
            model.warnings.push_back(Warning{WarningKind::Overlap, overlap.room1, overlap.message});
        }
        FLOORPLAN_LOG_DEBUG("floor %s: %zu rooms placed in %d of %d passes",
            floorId.c_str(), resolution.positions.size(), resolution.passes, resolution.passBudget);
    }

    const ValidationContext ctx{floorplan, model.variables.variables, model.config, model.positions};
    std::vector<Warning> findings = validateFloorplan(ctx);
    model.warnings.insert(model.warnings.end(),
        std::make_move_iterator(findings.begin()), std::make_move_iterator(findings.end()));

    for (const ResolutionError& err : model.errors) {
        FLOORPLAN_LOG_WARN("%s: %s", toString(err.kind), err.message.c_str());
    }
    return model;
}

ConversionResult convertFloorplan(const Floorplan& floorplan, const RenderOptions& options) {
    const ResolvedModel model = resolveModel(floorplan);

    ConversionResult result;
    JsonExportResult exported = exportJson(model);
    result.json = std::move(exported.data);
    result.exportErrors = std::move(exported.errors);
    result.svg = renderSvg(model, options);
    result.errors = model.errors;
    result.versionErrors = model.versionErrors;
    result.warnings = model.warnings;
    return result;
}

} // namespace floorplan
