#ifndef FLOORPLAN_SVG_BUILDER_H
#define FLOORPLAN_SVG_BUILDER_H

#include <string>
#include <string_view>
#include <utility>

namespace floorplan {

/**
 * Append-only SVG text builder.
 *
 * Elements are written as `open(tag).attr(...).attr(...).selfClose()` or
 * `open(tag)...close()` followed later by `end(tag)`. Numbers go through
 * formatNumber so identical input always yields identical bytes. Attribute
 * values and text content are XML-escaped; comments never contain "--".
 */
class SvgBuilder {
public:
    SvgBuilder& open(const char* tag);
    SvgBuilder& attr(const char* name, double value);
    SvgBuilder& attr(const char* name, int value);
    SvgBuilder& attr(const char* name, const char* value);
    SvgBuilder& attr(const char* name, const std::string& value);
    SvgBuilder& selfClose();
    SvgBuilder& close();
    SvgBuilder& end(const char* tag);
    SvgBuilder& text(std::string_view content);
    SvgBuilder& comment(std::string_view content);
    SvgBuilder& raw(std::string_view markup);

    // <tag ...>content</tag> for the common text-only element.
    SvgBuilder& textElement(const char* tag, std::string_view content);

    const std::string& str() const noexcept { return out_; }
    std::string release() { return std::move(out_); }
    bool empty() const noexcept { return out_.empty(); }

private:
    std::string out_;
};

// "x1,y1 x2,y2 ..." for polygon points.
std::string formatPoint(double x, double y);

} // namespace floorplan

#endif // FLOORPLAN_SVG_BUILDER_H
