#include "floorplan/render/svg_builder.h"
#include "floorplan/core/string_utils.h"

namespace floorplan {

SvgBuilder& SvgBuilder::open(const char* tag) {
    out_ += '<';
    out_ += tag;
    return *this;
}

SvgBuilder& SvgBuilder::attr(const char* name, double value) {
    out_ += ' ';
    out_ += name;
    out_ += "=\"";
    out_ += formatNumber(value);
    out_ += '"';
    return *this;
}

SvgBuilder& SvgBuilder::attr(const char* name, int value) {
    out_ += ' ';
    out_ += name;
    out_ += "=\"";
    out_ += std::to_string(value);
    out_ += '"';
    return *this;
}

SvgBuilder& SvgBuilder::attr(const char* name, const char* value) {
    return attr(name, std::string(value));
}

SvgBuilder& SvgBuilder::attr(const char* name, const std::string& value) {
    out_ += ' ';
    out_ += name;
    out_ += "=\"";
    out_ += escapeXml(value);
    out_ += '"';
    return *this;
}

SvgBuilder& SvgBuilder::selfClose() {
    out_ += "/>";
    return *this;
}

SvgBuilder& SvgBuilder::close() {
    out_ += '>';
    return *this;
}

SvgBuilder& SvgBuilder::end(const char* tag) {
    out_ += "</";
    out_ += tag;
    out_ += '>';
    return *this;
}

SvgBuilder& SvgBuilder::text(std::string_view content) {
    out_ += escapeXml(content);
    return *this;
}

SvgBuilder& SvgBuilder::comment(std::string_view content) {
    // "--" may not appear inside an XML comment.
    out_ += "<!-- ";
    char prev = ' ';
    for (const char c : content) {
        if (c == '-' && prev == '-') out_ += ' ';
        out_ += c;
        prev = c;
    }
    out_ += " -->";
    return *this;
}

SvgBuilder& SvgBuilder::raw(std::string_view markup) {
    out_ += markup;
    return *this;
}

SvgBuilder& SvgBuilder::textElement(const char* tag, std::string_view content) {
    close();
    text(content);
    return end(tag);
}

std::string formatPoint(double x, double y) {
    return formatNumber(x) + "," + formatNumber(y);
}

} // namespace floorplan
