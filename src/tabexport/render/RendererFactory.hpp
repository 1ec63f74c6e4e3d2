#pragma once

#include "tabexport/render/IResultRenderer.hpp"
#include "tabexport/core/ExportOptions.hpp"
#include <memory>
#include <ostream>

namespace tabexport {
namespace session {
class WorkbookSession;
}

namespace render {

/**
 * @brief 按输出格式创建渲染器
 */
class RendererFactory {
public:
    /**
     * @param options 导出选项
     * @param out 文本类输出的目标流
     * @param session 工作簿会话，仅 Xls 格式需要
     * @throws ParameterException Xls 格式未提供会话
     */
    static std::unique_ptr<IResultRenderer> create(const core::ExportOptions& options,
                                                   std::ostream& out,
                                                   session::WorkbookSession* session = nullptr);
};

}} // namespace tabexport::render
