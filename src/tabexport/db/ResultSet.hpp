#pragma once

#include "tabexport/core/ColumnTypes.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace tabexport {
namespace db {

/**
 * @brief 单个结果集的逐行游标
 */
class IResultSet {
public:
    virtual ~IResultSet() = default;
    
    virtual const std::vector<core::ColumnDescriptor>& columns() const = 0;
    
    /**
     * @brief 读取下一行
     * @param row 输出行，空值为 Constants::kNullMarker
     * @return 没有更多行时返回 false
     * @throws DatabaseException 读取失败
     */
    virtual bool nextRow(core::Row& row) = 0;
    
    /**
     * @brief 取出并清空迭代过程中累积的警告
     */
    virtual std::vector<std::string> drainWarnings() = 0;
};

/**
 * @brief 语句产生的一个结果：结果集或更新行数
 */
struct StatementResult {
    std::unique_ptr<IResultSet> result_set;
    int64_t update_count = -1;
    
    bool isResultSet() const { return result_set != nullptr; }
};

/**
 * @brief 一次执行产生的结果序列
 * 
 * 取下一个结果之前必须把当前结果集读完或丢弃。
 */
class IStatementResults {
public:
    virtual ~IStatementResults() = default;
    
    /**
     * @brief 下一个结果，结束时返回 std::nullopt
     * @throws DatabaseException 语句执行失败
     */
    virtual std::optional<StatementResult> next() = 0;
};

/**
 * @brief 语句执行器
 */
class IStatementExecutor {
public:
    virtual ~IStatementExecutor() = default;
    
    /**
     * @brief 执行一段语句文本（可包含多条以 ';' 分隔的语句）
     */
    virtual std::unique_ptr<IStatementResults> execute(const std::string& sql) = 0;
    
    /**
     * @brief 连接串（用于提示符）
     */
    virtual const std::string& url() const = 0;
};

}} // namespace tabexport::db
