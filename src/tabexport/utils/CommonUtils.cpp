#include "tabexport/utils/CommonUtils.hpp"
#include <cmath>
#include <system_error>
#include <fast_float/fast_float.h>
#include <fmt/format.h>

namespace tabexport {
namespace utils {

std::optional<double> CommonUtils::parseDouble(std::string_view text) {
    std::string trimmed = trim(text);
    if (trimmed.empty()) {
        return std::nullopt;
    }
    
    // fast_float 与区域设置无关，小数点固定为 '.'
    double value = 0.0;
    const char* last = trimmed.data() + trimmed.size();
    auto result = fast_float::from_chars(trimmed.data(), last, value);
    if (result.ec != std::errc{} || result.ptr != last || !std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}

std::string CommonUtils::formatNumber(double value, const std::string& number_format) {
    if (number_format.empty()) {
        return fmt::format("{}", value);
    }
    
    size_t dot = number_format.find('.');
    int decimals = dot == std::string::npos ? 0 : static_cast<int>(number_format.size() - dot - 1);
    bool grouping = number_format.find(',') != std::string::npos;
    
    std::string digits = fmt::format("{:.{}f}", std::fabs(value), decimals);
    if (grouping) {
        size_t int_end = digits.find('.');
        if (int_end == std::string::npos) {
            int_end = digits.size();
        }
        for (size_t pos = int_end; pos > 3; pos -= 3) {
            digits.insert(pos - 3, 1, ',');
        }
    }
    return value < 0 ? "-" + digits : digits;
}

}} // namespace tabexport::utils
