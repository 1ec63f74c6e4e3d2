#pragma once

#include <cmath>
#include <algorithm>
#include <cstddef>

namespace tabexport {
namespace utils {

/**
 * @brief 列宽换算工具类
 * 
 * 列宽以默认字体下"0"字符的像素宽度（MDW）为单位，外加固定 5 像素内边距。
 * 2003 XML 工作簿中的 ss:Width 以磅为单位，1 像素 = 0.75 磅（96 DPI）。
 */
class ColumnWidthCalculator {
public:
    static constexpr int kDefaultMDW = 7;          // Arial 10pt
    static constexpr double kDefaultFontSize = 10.0;
    static constexpr int kExcelPaddingPx = 5;
    static constexpr double kPointsPerPixel = 0.75;
    static constexpr double kMaxWidthChars = 255.0;
    
private:
    int mdw_;
    
public:
    explicit ColumnWidthCalculator(int mdw = kDefaultMDW) 
        : mdw_(std::max(1, mdw)) {}
    
    /**
     * @brief 按字号估算 MDW，以 Arial 10pt 的 7 像素为基准
     */
    static ColumnWidthCalculator forFontSize(double font_size) {
        double scaled = kDefaultMDW * font_size / kDefaultFontSize;
        return ColumnWidthCalculator(static_cast<int>(std::lround(scaled)));
    }
    
    int getMDW() const { return mdw_; }
    
    /**
     * @brief 字符数量化为可显示的列宽
     * width = Truncate([chars * MDW + 5] / MDW * 256) / 256
     */
    double quantize(double chars) const {
        if (chars <= 0) return 0;
        double numerator = std::min(chars, kMaxWidthChars) * mdw_ + kExcelPaddingPx;
        return std::floor(numerator / mdw_ * 256.0) / 256.0;
    }
    
    /**
     * @brief 列宽转像素
     * pixels = Truncate(((256 * width + Truncate(128/MDW))/256) * MDW)
     */
    int colWidthToPixels(double width_chars) const {
        double truncate_factor = std::floor(128.0 / mdw_);
        double raw_pixels = ((256.0 * width_chars + truncate_factor) / 256.0) * mdw_;
        return static_cast<int>(std::floor(raw_pixels));
    }
    
    /**
     * @brief 容纳指定字符数所需的列宽（磅）
     */
    double charsToPoints(size_t chars) const {
        int pixels = colWidthToPixels(quantize(static_cast<double>(chars)));
        return pixels * kPointsPerPixel;
    }
    
    /**
     * @brief 磅转回字符数（近似）
     */
    double pointsToChars(double points) const {
        double pixels = points / kPointsPerPixel;
        return std::max(0.0, (pixels - kExcelPaddingPx) / mdw_);
    }
};

}} // namespace tabexport::utils
