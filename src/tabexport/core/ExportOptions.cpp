#include "tabexport/core/ExportOptions.hpp"
#include "tabexport/core/Constants.hpp"
#include "tabexport/utils/CommonUtils.hpp"
#include "tabexport/utils/ModuleLoggers.hpp"
#include <regex>

namespace tabexport {
namespace core {

std::vector<std::string> ExportOptions::tabNames() const {
    std::vector<std::string> names;
    names.reserve(tabs.size());
    for (const auto& tab : tabs) {
        names.push_back(tab.name);
    }
    return names;
}

std::vector<std::string> ExportOptions::tabTitles() const {
    std::vector<std::string> titles;
    titles.reserve(tabs.size());
    for (const auto& tab : tabs) {
        titles.push_back(tab.title);
    }
    return titles;
}

std::optional<OutputFormat> parseOutputFormat(std::string_view name) {
    if (utils::CommonUtils::iequals(name, "text")) return OutputFormat::Text;
    if (utils::CommonUtils::iequals(name, "csv")) return OutputFormat::Csv;
    if (utils::CommonUtils::iequals(name, "html")) return OutputFormat::Html;
    if (utils::CommonUtils::iequals(name, "xls")) return OutputFormat::Xls;
    return std::nullopt;
}

const char* toString(OutputFormat format) noexcept {
    switch (format) {
        case OutputFormat::Text: return "text";
        case OutputFormat::Csv:  return "csv";
        case OutputFormat::Html: return "html";
        case OutputFormat::Xls:  return "xls";
    }
    return "unknown";
}

std::string normalizeTitle(const std::string& raw) {
    if (!raw.empty() && raw.front() == '{') {
        return raw;
    }
    return std::string(Constants::kDefaultTitleDirective) + raw;
}

std::vector<TabSpec> parseTabSpec(const std::string& spec) {
    std::vector<TabSpec> tabs;
    
    static const std::regex kTabPattern(R"((\[[^\[]*\])*)");
    if (spec.empty() || !std::regex_match(spec, kTabPattern)) {
        CORE_DEBUG("Ignoring tab specification '{}'", spec);
        return tabs;
    }
    
    // 去掉首尾的方括号后按 "][" 切分
    std::string body = spec.substr(1, spec.size() - 2);
    for (const auto& entry : utils::CommonUtils::splitAny(body, "][")) {
        auto parts = utils::CommonUtils::splitAny(entry, "|");
        if (parts.empty()) {
            continue;
        }
        
        TabSpec tab;
        tab.name = parts[0];
        tab.title = parts.size() > 1 ? normalizeTitle(parts[1])
                                     : std::string(Constants::kDefaultTitleDirective) + tab.name;
        CORE_DEBUG("Configured tab '{}' with title '{}'", tab.name, tab.title);
        tabs.push_back(std::move(tab));
    }
    return tabs;
}

}} // namespace tabexport::core
