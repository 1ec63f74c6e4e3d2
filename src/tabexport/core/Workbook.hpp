#pragma once

#include "tabexport/core/Worksheet.hpp"
#include "tabexport/core/FormatRepository.hpp"
#include "tabexport/core/Expected.hpp"
#include <string>
#include <vector>
#include <memory>
#include <optional>

namespace tabexport {
namespace core {

/**
 * @brief 工作簿
 * 
 * 有序的工作表集合加一个共享的格式仓储。以 2003 XML 表格格式
 * 保存和加载，追加模式下会先加载已有文件再继续写入。
 */
class Workbook {
private:
    std::vector<std::shared_ptr<Worksheet>> worksheets_;
    std::unique_ptr<FormatRepository> format_repo_;
    
    std::string generateUniqueSheetName(const std::string& base_name) const;

public:
    Workbook();
    ~Workbook() = default;
    
    Workbook(const Workbook&) = delete;
    Workbook& operator=(const Workbook&) = delete;
    
    // ========== 工作表管理 ==========
    
    /**
     * @brief 添加工作表
     * @param name 工作表名称，为空时自动生成 "SheetN"
     * @return 新工作表
     * @throws WorksheetException 名称重复或不合法
     */
    std::shared_ptr<Worksheet> addSheet(const std::string& name = "");
    
    /**
     * @brief 按名称获取工作表
     * @return 不存在时返回 nullptr
     */
    std::shared_ptr<Worksheet> getSheet(const std::string& name);
    std::shared_ptr<const Worksheet> getSheet(const std::string& name) const;
    
    std::shared_ptr<Worksheet> getSheet(size_t index);
    std::shared_ptr<const Worksheet> getSheet(size_t index) const;
    
    /**
     * @brief 工作表序号
     */
    std::optional<size_t> getSheetIndex(const std::string& name) const;
    
    bool hasSheet(const std::string& name) const { return getSheetIndex(name).has_value(); }
    size_t getSheetCount() const { return worksheets_.size(); }
    std::vector<std::string> getSheetNames() const;
    
    // ========== 格式管理 ==========
    
    FormatRepository& getFormatRepository() { return *format_repo_; }
    const FormatRepository& getFormatRepository() const { return *format_repo_; }
    
    /**
     * @brief 登记格式并返回仓储中的共享实例
     */
    std::shared_ptr<const FormatDescriptor> addFormat(const FormatDescriptor& format);
    
    // ========== 持久化 ==========
    
    /**
     * @brief 保存到文件（覆盖）
     * @throws FileException 文件无法写入
     */
    void save(const std::string& path) const;
    
    /**
     * @brief 从文件加载
     * @return 文件不存在或内容无效时返回错误
     */
    static Result<std::unique_ptr<Workbook>> load(const std::string& path);
};

}} // namespace tabexport::core
