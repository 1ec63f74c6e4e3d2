#include "tabexport/db/SqliteExecutor.hpp"
#include "tabexport/core/Constants.hpp"
#include "tabexport/core/Exception.hpp"
#include "tabexport/utils/CommonUtils.hpp"
#include "tabexport/utils/ModuleLoggers.hpp"
#include <sqlite3.h>
#include <algorithm>
#include <cctype>
#include <set>
#include <fmt/format.h>

namespace tabexport {
namespace db {

namespace {

using StatementPtr = std::unique_ptr<sqlite3_stmt, int(*)(sqlite3_stmt*)>;

core::ColumnType classifyStorageClass(int storage_class) {
    switch (storage_class) {
        case SQLITE_INTEGER: return core::ColumnType::IntegerLike;
        case SQLITE_FLOAT:   return core::ColumnType::Fractional;
        default:             return core::ColumnType::Other;
    }
}

/**
 * @brief SQLite 结果集：预读一行，用于在没有声明类型时判断列类型
 */
class SqliteResultSet : public IResultSet {
private:
    sqlite3* db_;
    StatementPtr stmt_;
    std::string statement_;
    std::vector<core::ColumnDescriptor> columns_;
    std::vector<std::string> warnings_;
    std::set<size_t> warned_columns_;
    bool has_row_ = false;
    
    void step() {
        int rc = sqlite3_step(stmt_.get());
        if (rc == SQLITE_ROW) {
            has_row_ = true;
        } else if (rc == SQLITE_DONE) {
            has_row_ = false;
        } else {
            has_row_ = false;
            throw core::DatabaseException(sqlite3_errmsg(db_), statement_,
                                          core::ErrorCode::StatementFailed, __FILE__, __LINE__);
        }
    }

public:
    SqliteResultSet(sqlite3* db, StatementPtr stmt, std::string statement)
        : db_(db), stmt_(std::move(stmt)), statement_(std::move(statement)) {
        step();
        
        int count = sqlite3_column_count(stmt_.get());
        columns_.reserve(static_cast<size_t>(count));
        for (int i = 0; i < count; ++i) {
            const char* name = sqlite3_column_name(stmt_.get(), i);
            const char* declared = sqlite3_column_decltype(stmt_.get(), i);
            
            core::ColumnType type = core::ColumnType::Other;
            if (declared) {
                type = SqliteExecutor::classifyDeclaredType(declared);
            } else if (has_row_) {
                type = classifyStorageClass(sqlite3_column_type(stmt_.get(), i));
            }
            columns_.emplace_back(name ? name : "", type);
        }
    }
    
    const std::vector<core::ColumnDescriptor>& columns() const override { return columns_; }
    
    bool nextRow(core::Row& row) override {
        if (!has_row_) {
            return false;
        }
        
        row.clear();
        row.reserve(columns_.size());
        for (size_t i = 0; i < columns_.size(); ++i) {
            int col = static_cast<int>(i);
            int storage_class = sqlite3_column_type(stmt_.get(), col);
            if (storage_class == SQLITE_NULL) {
                row.emplace_back(core::Constants::kNullMarker);
                continue;
            }
            
            if (core::isNumeric(columns_[i].type) &&
                (storage_class == SQLITE_TEXT || storage_class == SQLITE_BLOB) &&
                warned_columns_.insert(i).second) {
                warnings_.push_back(fmt::format("column '{}' holds non-numeric values", columns_[i].name));
            }
            
            const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt_.get(), col));
            int bytes = sqlite3_column_bytes(stmt_.get(), col);
            row.emplace_back(text ? std::string(text, static_cast<size_t>(bytes)) : std::string());
        }
        
        step();
        return true;
    }
    
    std::vector<std::string> drainWarnings() override {
        std::vector<std::string> drained;
        drained.swap(warnings_);
        return drained;
    }
};

/**
 * @brief 逐条准备并执行语句文本中的各条语句
 */
class SqliteStatementResults : public IStatementResults {
private:
    sqlite3* db_;
    std::string sql_;
    size_t offset_ = 0;

public:
    SqliteStatementResults(sqlite3* db, std::string sql)
        : db_(db), sql_(std::move(sql)) {}
    
    std::optional<StatementResult> next() override {
        while (offset_ < sql_.size()) {
            const char* start = sql_.c_str() + offset_;
            const char* tail = nullptr;
            sqlite3_stmt* raw = nullptr;
            int rc = sqlite3_prepare_v2(db_, start, -1, &raw, &tail);
            StatementPtr stmt(raw, &sqlite3_finalize);
            
            size_t consumed = tail ? static_cast<size_t>(tail - start) : sql_.size() - offset_;
            std::string text = utils::CommonUtils::trim(std::string_view(start, consumed));
            if (rc != SQLITE_OK) {
                throw core::DatabaseException(sqlite3_errmsg(db_), text,
                                              core::ErrorCode::StatementFailed, __FILE__, __LINE__);
            }
            offset_ += consumed;
            
            // 空白或注释
            if (!stmt) {
                if (consumed == 0) {
                    break;
                }
                continue;
            }
            
            if (sqlite3_column_count(stmt.get()) > 0) {
                DB_DEBUG("Query: {}", text);
                StatementResult result;
                result.result_set = std::make_unique<SqliteResultSet>(db_, std::move(stmt), text);
                return result;
            }
            
            int total_before = sqlite3_total_changes(db_);
            while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
            }
            if (rc != SQLITE_DONE) {
                throw core::DatabaseException(sqlite3_errmsg(db_), text,
                                              core::ErrorCode::StatementFailed, __FILE__, __LINE__);
            }
            
            StatementResult result;
            result.update_count = sqlite3_total_changes(db_) != total_before ? sqlite3_changes(db_) : 0;
            DB_DEBUG("Update: {} ({} rows)", text, result.update_count);
            return result;
        }
        return std::nullopt;
    }
};

} // namespace

SqliteExecutor::SqliteExecutor(const std::string& url)
    : url_(url)
    , path_(parseLocation(url)) {
    if (path_.empty()) {
        TABEXPORT_THROW(core::DatabaseException, "Empty database location", url,
                        core::ErrorCode::DatabaseOpenFailed);
    }
    
    if (int rc = sqlite3_open(path_.c_str(), &db_); rc != SQLITE_OK) {
        std::string error = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
        sqlite3_close(db_);
        db_ = nullptr;
        TABEXPORT_THROW(core::DatabaseException, "Failed to open database '" + path_ + "': " + error, url,
                        core::ErrorCode::DatabaseOpenFailed);
    }
    DB_INFO("Opened SQLite database '{}'", path_);
}

SqliteExecutor::~SqliteExecutor() {
    if (db_) {
        sqlite3_close_v2(db_);
        db_ = nullptr;
    }
}

void SqliteExecutor::close() {
    if (!db_) {
        return;
    }
    int rc = sqlite3_close(db_);
    if (rc != SQLITE_OK) {
        TABEXPORT_THROW(core::DatabaseException, std::string("Failed to close database: ") + sqlite3_errmsg(db_),
                        url_, core::ErrorCode::DatabaseCloseFailed);
    }
    db_ = nullptr;
    DB_DEBUG("Closed SQLite database '{}'", path_);
}

std::unique_ptr<IStatementResults> SqliteExecutor::execute(const std::string& sql) {
    if (!db_) {
        TABEXPORT_THROW(core::DatabaseException, "Database is closed", sql, core::ErrorCode::StatementFailed);
    }
    return std::make_unique<SqliteStatementResults>(db_, sql);
}

std::string SqliteExecutor::parseLocation(const std::string& url) {
    std::string_view location(url);
    if (utils::CommonUtils::startsWith(location, "jdbc:")) {
        location.remove_prefix(5);
    }
    if (utils::CommonUtils::startsWith(location, "sqlite:")) {
        location.remove_prefix(7);
    }
    return std::string(location);
}

core::ColumnType SqliteExecutor::classifyDeclaredType(const std::string& declared_type) {
    std::string upper(declared_type);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    
    if (upper.find("INT") != std::string::npos) {
        return core::ColumnType::IntegerLike;
    }
    for (const char* token : {"REAL", "FLOA", "DOUB", "NUM", "DEC"}) {
        if (upper.find(token) != std::string::npos) {
            return core::ColumnType::Fractional;
        }
    }
    return core::ColumnType::Other;
}

}} // namespace tabexport::db
