/**
 * @file FileWrapper.hpp
 * @brief RAII文件句柄包装器
 */

#pragma once

#include <memory>
#include <cstdio>
#include <string>
#include "tabexport/core/Exception.hpp"

namespace tabexport {
namespace utils {

/**
 * @brief RAII文件句柄包装器
 * 
 * 析构时自动关闭文件；需要确认写入结果时显式调用 close()。
 */
class FileWrapper {
public:
    /**
     * @brief 打开文件
     * @param filename 文件名
     * @param mode fopen 打开模式
     * @throws FileException 文件打开失败时
     */
    FileWrapper(const std::string& filename, const char* mode)
        : filename_(filename) {
        file_.reset(std::fopen(filename.c_str(), mode));
        if (!file_) {
            bool writing = mode[0] == 'w' || mode[0] == 'a';
            throw core::FileException(
                "Failed to open file: " + filename,
                filename,
                writing ? core::ErrorCode::FileAccessDenied : core::ErrorCode::FileNotFound,
                __FILE__, __LINE__
            );
        }
    }
    
    FileWrapper(FileWrapper&& other) noexcept = default;
    FileWrapper& operator=(FileWrapper&& other) noexcept = default;
    
    FileWrapper(const FileWrapper&) = delete;
    FileWrapper& operator=(const FileWrapper&) = delete;
    
    FILE* get() const noexcept { 
        return file_.get(); 
    }
    
    explicit operator bool() const noexcept { 
        return file_ != nullptr; 
    }
    
    const std::string& getFilename() const { return filename_; }
    
    /**
     * @brief 写入数据
     * @throws FileException 写入不完整
     */
    void write(const char* data, size_t length) {
        if (length == 0) return;
        if (!file_ || std::fwrite(data, 1, length, file_.get()) != length) {
            throw core::FileException("Failed to write file: " + filename_, filename_,
                                      core::ErrorCode::FileWriteError, __FILE__, __LINE__);
        }
    }
    
    /**
     * @brief 读取数据
     * @return 实际读取的字节数，0 表示结束
     * @throws FileException 读取出错
     */
    size_t read(char* buffer, size_t capacity) {
        size_t n = std::fread(buffer, 1, capacity, file_.get());
        if (n < capacity && std::ferror(file_.get())) {
            throw core::FileException("Failed to read file: " + filename_, filename_,
                                      core::ErrorCode::FileReadError, __FILE__, __LINE__);
        }
        return n;
    }
    
    void flush() {
        if (file_) {
            std::fflush(file_.get());
        }
    }
    
    /**
     * @brief 关闭文件并检查结果
     * @throws FileException 关闭失败（缓冲数据未能落盘）
     */
    void close() {
        FILE* raw = file_.release();
        if (raw && std::fclose(raw) != 0) {
            throw core::FileException("Failed to close file: " + filename_, filename_,
                                      core::ErrorCode::FileWriteError, __FILE__, __LINE__);
        }
    }

private:
    std::string filename_;
    std::unique_ptr<FILE, int(*)(FILE*)> file_{nullptr, &std::fclose};
};

} // namespace utils
} // namespace tabexport
