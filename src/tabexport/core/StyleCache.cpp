#include "tabexport/core/StyleCache.hpp"
#include "tabexport/core/StyleBuilder.hpp"
#include "tabexport/utils/ModuleLoggers.hpp"

namespace tabexport {
namespace core {

std::shared_ptr<const FormatDescriptor> StyleCache::getOrCreate(const StyleDirective& directive) {
    std::string key = directive.styleKey();
    auto it = styles_.find(key);
    if (it != styles_.end()) {
        ++hits_;
        return it->second;
    }
    
    StyleBuilder builder;
    builder.fontSize(directive.fontSize())
           .bold(directive.bold)
           .italic(directive.italic)
           .underline(directive.underline ? UnderlineType::Single : UnderlineType::None);
    
    auto style = std::make_shared<const FormatDescriptor>(builder.build());
    styles_.emplace(key, style);
    CORE_DEBUG("Created style '{}' ({}pt)", key, directive.fontSize());
    return style;
}

}} // namespace tabexport::core
