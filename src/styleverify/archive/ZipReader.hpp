#pragma once

#include "styleverify/archive/ZipError.hpp"
#include <cstdint>
#include <ctime>
#include <map>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace styleverify {
namespace archive {

/**
 * @brief ZIP读取器 - 读取 .docx 包中的部件
 *
 * 可以打开磁盘文件，也可以打开内存中的字节（上传的文档）。
 * 线程安全，条目信息在打开时缓存。
 */
class ZipReader {
public:
    // ========== 条目信息结构 ==========
    struct EntryInfo {
        std::string path;
        uint64_t compressed_size = 0;
        uint64_t uncompressed_size = 0;
        uint32_t crc32 = 0;
        int compression_method = 0;
        time_t modified_date = 0;
        bool is_directory = false;
    };

    // 单个条目的解压上限，防止压缩炸弹
    static constexpr uint64_t kMaxEntrySize = 256ULL * 1024 * 1024;

    // ========== 构造/析构 ==========

    /**
     * @brief 从磁盘文件读取
     */
    static ZipReader fromFile(const std::string& path);

    /**
     * @brief 从内存读取，字节被复制到读取器内部
     */
    static ZipReader fromMemory(const std::vector<uint8_t>& bytes, std::string display_name = "<memory>");

    ~ZipReader();

    ZipReader(const ZipReader&) = delete;
    ZipReader& operator=(const ZipReader&) = delete;

    ZipReader(ZipReader&& other) noexcept;
    ZipReader& operator=(ZipReader&& other) noexcept;

    // ========== 文件操作 ==========

    ZipError open();
    void close();
    bool isOpen() const { return is_open_; }

    const std::string& getName() const { return name_; }

    // ========== 条目查询 ==========

    /**
     * @brief 所有条目路径，按字典序
     */
    std::vector<std::string> listFiles() const;

    ZipError fileExists(std::string_view internal_path) const;

    bool getEntryInfo(std::string_view internal_path, EntryInfo& info) const;

    // ========== 读取操作 ==========

    ZipError extractFile(std::string_view internal_path, std::string& content);
    ZipError extractFile(std::string_view internal_path, std::vector<uint8_t>& data);

private:
    ZipReader() = default;

    ZipError extractFileInternal(std::string_view internal_path, std::vector<uint8_t>& data) const;
    void buildEntryCache();
    void cleanup();

    void* unzip_handle_ = nullptr;
    std::string name_;
    std::string file_path_;             // 为空表示内存模式
    std::vector<uint8_t> buffer_;
    bool is_open_ = false;
    mutable std::mutex mutex_;

    std::map<std::string, EntryInfo> entry_cache_;
};

}} // namespace styleverify::archive
