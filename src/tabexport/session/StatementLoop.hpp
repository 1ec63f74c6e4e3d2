#pragma once

#include "tabexport/session/ExportEngine.hpp"
#include <istream>
#include <ostream>
#include <string>

namespace tabexport {
namespace session {

/**
 * @brief 交互式语句循环
 * 
 * 每行一条语句；空行跳过，quit/exit（不区分大小写）或输入结束时退出。
 * 单条语句的错误记录为 "Error: ..." 后继续，输出文件错误向上传播。
 */
class StatementLoop {
private:
    ExportEngine& engine_;
    std::istream& in_;
    std::ostream& prompt_out_;
    std::string prompt_;
    bool show_prompt_;
    size_t executed_ = 0;
    size_t failed_ = 0;

public:
    StatementLoop(ExportEngine& engine, std::istream& in, std::ostream& prompt_out,
                  const std::string& url, bool quiet);
    
    /**
     * @brief 运行到输入结束或 quit/exit
     * @return 执行失败的语句数
     * @throws FileException 输出文件写入失败
     */
    size_t run();
    
    size_t executedCount() const { return executed_; }
    size_t failedCount() const { return failed_; }
    
    /**
     * @brief 提示符：去掉 "jdbc:" 前缀的连接串加 "> "
     */
    static std::string makePrompt(const std::string& url);
    
    static bool isExitCommand(const std::string& line);
};

}} // namespace tabexport::session
