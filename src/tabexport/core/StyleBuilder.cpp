#include "tabexport/core/StyleBuilder.hpp"
#include <algorithm>

namespace tabexport {
namespace core {

StyleBuilder::StyleBuilder(const FormatDescriptor& format)
    : font_name_(format.getFontName()),
      font_size_(format.getFontSize()),
      bold_(format.isBold()),
      italic_(format.isItalic()),
      underline_(format.getUnderline()),
      horizontal_align_(format.getHorizontalAlign()),
      vertical_align_(format.getVerticalAlign()),
      num_format_(format.getNumberFormat()) {
}

StyleBuilder& StyleBuilder::fontSize(double size) {
    font_size_ = std::clamp(size, 1.0, 409.0);
    return *this;
}

FormatDescriptor StyleBuilder::build() const {
    return FormatDescriptor(font_name_, font_size_, bold_, italic_, underline_,
                            horizontal_align_, vertical_align_, num_format_);
}

}} // namespace tabexport::core
