#pragma once

#include "tabexport/db/ResultSet.hpp"
#include <string>

struct sqlite3;

namespace tabexport {
namespace db {

/**
 * @brief 基于 SQLite 的语句执行器
 * 
 * 连接串支持 `file.db`、`sqlite:file.db`、`jdbc:sqlite:file.db` 和 `:memory:`。
 * 列类型由声明类型推断：含 INT 为整数，含 REAL/FLOA/DOUB/NUM/DEC 为小数；
 * 没有声明类型时按首行的存储类型判断。
 */
class SqliteExecutor : public IStatementExecutor {
private:
    std::string url_;
    std::string path_;
    sqlite3* db_ = nullptr;

public:
    /**
     * @brief 打开数据库
     * @throws DatabaseException 打开失败
     */
    explicit SqliteExecutor(const std::string& url);
    ~SqliteExecutor() override;
    
    SqliteExecutor(const SqliteExecutor&) = delete;
    SqliteExecutor& operator=(const SqliteExecutor&) = delete;
    
    std::unique_ptr<IStatementResults> execute(const std::string& sql) override;
    const std::string& url() const override { return url_; }
    const std::string& path() const { return path_; }
    
    /**
     * @brief 显式关闭连接
     * @throws DatabaseException 关闭失败（例如仍有未结束的语句）
     */
    void close();
    
    bool isOpen() const { return db_ != nullptr; }
    
    /**
     * @brief 去掉连接串中的 jdbc:/sqlite: 前缀得到文件路径
     */
    static std::string parseLocation(const std::string& url);
    
    /**
     * @brief 由声明类型推断列类型
     */
    static core::ColumnType classifyDeclaredType(const std::string& declared_type);
};

}} // namespace tabexport::db
