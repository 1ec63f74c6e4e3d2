#include "tabexport/core/FormatTypes.hpp"
#include <cstring>

namespace tabexport {
namespace core {

const char* toString(UnderlineType underline) {
    switch (underline) {
        case UnderlineType::Single: return "Single";
        case UnderlineType::Double: return "Double";
        default: return "";
    }
}

const char* toString(HorizontalAlign align) {
    switch (align) {
        case HorizontalAlign::Left:   return "Left";
        case HorizontalAlign::Center: return "Center";
        case HorizontalAlign::Right:  return "Right";
        default: return "";
    }
}

const char* toString(VerticalAlign align) {
    switch (align) {
        case VerticalAlign::Top:    return "Top";
        case VerticalAlign::Center: return "Center";
        default: return "Bottom";
    }
}

UnderlineType parseUnderline(const char* value) {
    if (!value) return UnderlineType::None;
    if (std::strcmp(value, "Single") == 0) return UnderlineType::Single;
    if (std::strcmp(value, "Double") == 0) return UnderlineType::Double;
    return UnderlineType::None;
}

HorizontalAlign parseHorizontalAlign(const char* value) {
    if (!value) return HorizontalAlign::None;
    if (std::strcmp(value, "Left") == 0) return HorizontalAlign::Left;
    if (std::strcmp(value, "Center") == 0) return HorizontalAlign::Center;
    if (std::strcmp(value, "Right") == 0) return HorizontalAlign::Right;
    return HorizontalAlign::None;
}

VerticalAlign parseVerticalAlign(const char* value) {
    if (!value) return VerticalAlign::Bottom;
    if (std::strcmp(value, "Top") == 0) return VerticalAlign::Top;
    if (std::strcmp(value, "Center") == 0) return VerticalAlign::Center;
    return VerticalAlign::Bottom;
}

}} // namespace tabexport::core
