#include "tabexport/session/TabResolver.hpp"
#include "tabexport/core/StyledCellWriter.hpp"
#include "tabexport/utils/ModuleLoggers.hpp"
#include <algorithm>

namespace tabexport {
namespace session {

size_t TabResolver::resolveIndex(int sequence) const {
    const auto& options = session_.options();
    if (options.pinned_sheet) {
        auto names = options.tabNames();
        auto it = std::find(names.begin(), names.end(), *options.pinned_sheet);
        if (it != names.end()) {
            return static_cast<size_t>(it - names.begin());
        }
    }
    return sequence > 0 ? static_cast<size_t>(sequence - 1) : 0;
}

void TabResolver::writeTitle(core::Worksheet& sheet, const std::string& title) {
    core::StyledCellWriter writer(session_.workbook(), session_.styleCache());
    writer.write(sheet, 0, 0, title);
}

ResolvedTab TabResolver::resolve(const std::vector<core::ColumnDescriptor>& columns) {
    core::Workbook& workbook = session_.workbook();
    const auto& options = session_.options();
    const auto names = options.tabNames();
    const auto titles = options.tabTitles();
    
    ResolvedTab tab;
    tab.index = resolveIndex(session_.resultSetSequence());
    tab.title = session_.title();
    if (tab.index < titles.size() && !titles[tab.index].empty()) {
        tab.title = titles[tab.index];
    }
    
    if (tab.index < names.size()) {
        tab.configured = true;
        
        // 补齐前面缺失的工作表
        for (size_t i = workbook.getSheetCount(); i < tab.index; ++i) {
            if (workbook.hasSheet(names[i])) {
                continue;
            }
            auto sheet = workbook.addSheet(names[i]);
            SESSION_DEBUG("Created intermediate sheet '{}'", names[i]);
            if (i < titles.size() && !titles[i].empty()) {
                writeTitle(*sheet, titles[i]);
            }
        }
        
        tab.sheet = workbook.getSheet(names[tab.index]);
        if (!tab.sheet) {
            tab.sheet = workbook.addSheet(names[tab.index]);
            tab.new_sheet = true;
        }
    } else {
        tab.sheet = workbook.addSheet();
        tab.new_sheet = true;
    }
    
    bool framing = (!session_.effectiveAppend() || options.increment_tab) && tab.new_sheet;
    if (framing) {
        if (tab.title) {
            writeTitle(*tab.sheet, *tab.title);
        }
        if (session_.headingsEnabled()) {
            core::StyledCellWriter writer(workbook, session_.styleCache());
            int row = tab.sheet->getLastRowNum() + 1;
            for (size_t i = 0; i < columns.size(); ++i) {
                const std::string& name = columns[i].name;
                if (!name.empty() && name.front() == '{') {
                    writer.write(*tab.sheet, row, static_cast<int>(i), name);
                } else {
                    tab.sheet->writeString(row, static_cast<int>(i), name);
                }
            }
        }
        tab.wrote_framing = true;
    }
    
    SESSION_DEBUG("Result set {} -> sheet '{}' (index {}, new={}, framing={})",
                  session_.resultSetSequence(), tab.sheet->getName(), tab.index, tab.new_sheet, framing);
    return tab;
}

}} // namespace tabexport::session
