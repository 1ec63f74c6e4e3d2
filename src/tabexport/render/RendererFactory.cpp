#include "tabexport/render/RendererFactory.hpp"
#include "tabexport/render/TextRenderer.hpp"
#include "tabexport/render/CsvRenderer.hpp"
#include "tabexport/render/HtmlRenderer.hpp"
#include "tabexport/render/WorkbookRenderer.hpp"
#include "tabexport/core/Exception.hpp"
#include "tabexport/utils/ModuleLoggers.hpp"

namespace tabexport {
namespace render {

std::unique_ptr<IResultRenderer> RendererFactory::create(const core::ExportOptions& options,
                                                         std::ostream& out,
                                                         session::WorkbookSession* session) {
    std::unique_ptr<IResultRenderer> renderer;
    switch (options.format) {
        case core::OutputFormat::Csv:
            renderer = std::make_unique<CsvRenderer>(out);
            break;
        case core::OutputFormat::Html:
            renderer = std::make_unique<HtmlRenderer>(out, options.css_file);
            break;
        case core::OutputFormat::Xls:
            if (!session) {
                TABEXPORT_THROW(core::ParameterException, "Workbook output requires a workbook session", "session");
            }
            renderer = std::make_unique<WorkbookRenderer>(*session);
            break;
        case core::OutputFormat::Text:
        default:
            renderer = std::make_unique<TextRenderer>(out);
            break;
    }
    
    RENDER_DEBUG("Created {} renderer", renderer->getTypeName());
    return renderer;
}

}} // namespace tabexport::render
