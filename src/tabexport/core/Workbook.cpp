#include "tabexport/core/Workbook.hpp"
#include "tabexport/core/Exception.hpp"
#include "tabexport/xml/SpreadsheetMLWriter.hpp"
#include "tabexport/reader/SpreadsheetMLReader.hpp"
#include "tabexport/utils/CommonUtils.hpp"
#include "tabexport/utils/ModuleLoggers.hpp"
#include <fmt/format.h>
#include <cctype>

namespace tabexport {
namespace core {

Workbook::Workbook()
    : format_repo_(std::make_unique<FormatRepository>()) {
}

std::string Workbook::generateUniqueSheetName(const std::string& base_name) const {
    if (!hasSheet(base_name)) {
        return base_name;
    }
    
    // 去掉末尾数字后从工作表数量往上找一个空闲编号
    std::string prefix = base_name;
    while (!prefix.empty() && std::isdigit(static_cast<unsigned char>(prefix.back()))) {
        prefix.pop_back();
    }
    
    size_t counter = worksheets_.size() + 1;
    std::string candidate;
    do {
        candidate = prefix + std::to_string(counter++);
    } while (hasSheet(candidate));
    return candidate;
}

std::shared_ptr<Worksheet> Workbook::addSheet(const std::string& name) {
    std::string sheet_name = name.empty()
        ? generateUniqueSheetName(fmt::format("Sheet{}", worksheets_.size() + 1))
        : name;
    
    if (!utils::CommonUtils::isValidSheetName(sheet_name)) {
        TABEXPORT_THROW(WorksheetException, fmt::format("Invalid sheet name: '{}'", sheet_name),
                        sheet_name, ErrorCode::InvalidWorksheet);
    }
    if (hasSheet(sheet_name)) {
        TABEXPORT_THROW(WorksheetException, fmt::format("Sheet already exists: '{}'", sheet_name),
                        sheet_name, ErrorCode::DuplicateSheetName);
    }
    
    auto worksheet = std::make_shared<Worksheet>(sheet_name, format_repo_.get());
    worksheets_.push_back(worksheet);
    CORE_DEBUG("Added worksheet '{}' at index {}", sheet_name, worksheets_.size() - 1);
    return worksheet;
}

std::shared_ptr<Worksheet> Workbook::getSheet(const std::string& name) {
    auto index = getSheetIndex(name);
    return index ? worksheets_[*index] : nullptr;
}

std::shared_ptr<const Worksheet> Workbook::getSheet(const std::string& name) const {
    auto index = getSheetIndex(name);
    return index ? worksheets_[*index] : nullptr;
}

std::shared_ptr<Worksheet> Workbook::getSheet(size_t index) {
    return index < worksheets_.size() ? worksheets_[index] : nullptr;
}

std::shared_ptr<const Worksheet> Workbook::getSheet(size_t index) const {
    return index < worksheets_.size() ? worksheets_[index] : nullptr;
}

std::optional<size_t> Workbook::getSheetIndex(const std::string& name) const {
    for (size_t i = 0; i < worksheets_.size(); ++i) {
        if (worksheets_[i]->getName() == name) {
            return i;
        }
    }
    return std::nullopt;
}

std::vector<std::string> Workbook::getSheetNames() const {
    std::vector<std::string> names;
    names.reserve(worksheets_.size());
    for (const auto& sheet : worksheets_) {
        names.push_back(sheet->getName());
    }
    return names;
}

std::shared_ptr<const FormatDescriptor> Workbook::addFormat(const FormatDescriptor& format) {
    return format_repo_->getFormat(format_repo_->addFormat(format));
}

void Workbook::save(const std::string& path) const {
    xml::SpreadsheetMLWriter writer(*this);
    writer.writeToFile(path);
    CORE_INFO("Saved workbook with {} sheet(s) to {}", worksheets_.size(), path);
}

Result<std::unique_ptr<Workbook>> Workbook::load(const std::string& path) {
    reader::SpreadsheetMLReader reader;
    return reader.read(path);
}

}} // namespace tabexport::core
