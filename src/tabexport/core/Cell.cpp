#include "tabexport/core/Cell.hpp"
#include "tabexport/utils/CommonUtils.hpp"
#include <fmt/format.h>

namespace tabexport {
namespace core {

double Cell::getNumberValue() const {
    if (const double* number = std::get_if<double>(&value_)) {
        return *number;
    }
    return 0.0;
}

const std::string& Cell::getStringValue() const {
    static const std::string empty;
    if (const std::string* text = std::get_if<std::string>(&value_)) {
        return *text;
    }
    return empty;
}

std::string Cell::getDisplayText() const {
    switch (getType()) {
        case CellType::Number: {
            const std::string& number_format = effectiveFormat().getNumberFormat();
            if (number_format.empty()) {
                return fmt::format("{}", getNumberValue());
            }
            return utils::CommonUtils::formatNumber(getNumberValue(), number_format);
        }
        case CellType::String:
            return getStringValue();
        default:
            return "";
    }
}

}} // namespace tabexport::core
