#pragma once

#include "tabexport/core/FormatRepository.hpp"
#include "tabexport/xml/XMLStreamWriter.hpp"
#include <string>

namespace tabexport {
namespace xml {

/**
 * @brief 样式序列化器
 * 
 * 把 FormatRepository 中的格式按ID顺序写成 <Styles> 区。
 * ID 0 写作 "Default"，其余写作 "s" + ID。
 */
class StyleSerializer {
public:
    static void serialize(const core::FormatRepository& repository, XMLStreamWriter& writer);
    
    /**
     * @brief 格式ID对应的 ss:ID
     */
    static std::string styleId(int format_id);

private:
    static void writeStyle(const std::string& id, const core::FormatDescriptor& format,
                           XMLStreamWriter& writer);
};

}} // namespace tabexport::xml
