#include "tabexport/core/FormatDescriptor.hpp"

namespace tabexport {
namespace core {

FormatDescriptor::FormatDescriptor(const std::string& font_name,
                                   double font_size,
                                   bool bold,
                                   bool italic,
                                   UnderlineType underline,
                                   HorizontalAlign horizontal_align,
                                   VerticalAlign vertical_align,
                                   const std::string& num_format)
    : font_name_(font_name),
      font_size_(font_size),
      bold_(bold),
      italic_(italic),
      underline_(underline),
      horizontal_align_(horizontal_align),
      vertical_align_(vertical_align),
      num_format_(num_format),
      hash_value_(calculateHash()) {
}

const FormatDescriptor& FormatDescriptor::getDefault() {
    static const FormatDescriptor default_format(
        "Arial", 10.0, false, false, UnderlineType::None,
        HorizontalAlign::None, VerticalAlign::Bottom, "");
    return default_format;
}

bool FormatDescriptor::hasFont() const {
    const auto& def = getDefault();
    return font_name_ != def.font_name_ ||
           font_size_ != def.font_size_ ||
           bold_ != def.bold_ ||
           italic_ != def.italic_ ||
           underline_ != def.underline_;
}

bool FormatDescriptor::hasAlignment() const {
    const auto& def = getDefault();
    return horizontal_align_ != def.horizontal_align_ ||
           vertical_align_ != def.vertical_align_;
}

bool FormatDescriptor::hasAnyFormatting() const {
    return hasFont() || hasAlignment() || !num_format_.empty();
}

bool FormatDescriptor::operator==(const FormatDescriptor& other) const {
    if (hash_value_ != other.hash_value_) {
        return false;
    }
    
    // 哈希相同时做完整比较，处理冲突
    return font_name_ == other.font_name_ &&
           font_size_ == other.font_size_ &&
           bold_ == other.bold_ &&
           italic_ == other.italic_ &&
           underline_ == other.underline_ &&
           horizontal_align_ == other.horizontal_align_ &&
           vertical_align_ == other.vertical_align_ &&
           num_format_ == other.num_format_;
}

size_t FormatDescriptor::calculateHash() const {
    std::hash<std::string> str_hasher;
    std::hash<double> double_hasher;
    std::hash<bool> bool_hasher;
    
    size_t hashes[] = {
        str_hasher(font_name_),
        double_hasher(font_size_),
        bool_hasher(bold_),
        bool_hasher(italic_),
        static_cast<size_t>(underline_),
        static_cast<size_t>(horizontal_align_),
        static_cast<size_t>(vertical_align_),
        str_hasher(num_format_)
    };
    
    size_t result = 0;
    for (size_t h : hashes) {
        result ^= h + 0x9e3779b9 + (result << 6) + (result >> 2);
    }
    return result;
}

}} // namespace tabexport::core
