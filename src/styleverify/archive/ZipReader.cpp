#include "styleverify/archive/ZipReader.hpp"
#include "styleverify/utils/ModuleLoggers.hpp"
#include <mz.h>
#include <mz_strm.h>
#include <mz_zip.h>
#include <mz_zip_rw.h>
#include <algorithm>
#include <limits>

namespace styleverify {
namespace archive {

// 构造/析构

ZipReader ZipReader::fromFile(const std::string& path) {
    ZipReader reader;
    reader.file_path_ = path;
    reader.name_ = path;
    return reader;
}

ZipReader ZipReader::fromMemory(const std::vector<uint8_t>& bytes, std::string display_name) {
    ZipReader reader;
    reader.buffer_ = bytes;
    reader.name_ = std::move(display_name);
    return reader;
}

ZipReader::~ZipReader() {
    cleanup();
}

ZipReader::ZipReader(ZipReader&& other) noexcept
    : unzip_handle_(other.unzip_handle_),
      name_(std::move(other.name_)),
      file_path_(std::move(other.file_path_)),
      buffer_(std::move(other.buffer_)),
      is_open_(other.is_open_),
      entry_cache_(std::move(other.entry_cache_)) {
    other.unzip_handle_ = nullptr;
    other.is_open_ = false;
}

ZipReader& ZipReader::operator=(ZipReader&& other) noexcept {
    if (this != &other) {
        cleanup();
        unzip_handle_ = other.unzip_handle_;
        name_ = std::move(other.name_);
        file_path_ = std::move(other.file_path_);
        buffer_ = std::move(other.buffer_);
        is_open_ = other.is_open_;
        entry_cache_ = std::move(other.entry_cache_);

        other.unzip_handle_ = nullptr;
        other.is_open_ = false;
    }
    return *this;
}

// 文件操作

ZipError ZipReader::open() {
    std::lock_guard<std::mutex> lock(mutex_);
    cleanup();

    if (file_path_.empty() && buffer_.empty()) {
        ARCHIVE_ERROR("Cannot open '{}': no input", name_);
        return ZipError::InvalidParameter;
    }
    if (buffer_.size() > static_cast<size_t>(std::numeric_limits<int32_t>::max())) {
        ARCHIVE_ERROR("Cannot open '{}': buffer of {} bytes is too large", name_, buffer_.size());
        return ZipError::TooLarge;
    }

    unzip_handle_ = mz_zip_reader_create();
    if (!unzip_handle_) {
        ARCHIVE_ERROR("Failed to create zip reader");
        return ZipError::InternalError;
    }

    int32_t result = file_path_.empty()
        ? mz_zip_reader_open_buffer(unzip_handle_, buffer_.data(),
                                    static_cast<int32_t>(buffer_.size()), 0)
        : mz_zip_reader_open_file(unzip_handle_, file_path_.c_str());
    if (result != MZ_OK) {
        ARCHIVE_ERROR("Failed to open zip '{}' for reading, error: {}", name_, result);
        mz_zip_reader_delete(&unzip_handle_);
        unzip_handle_ = nullptr;
        return file_path_.empty() ? ZipError::BadFormat : ZipError::IoFail;
    }

    is_open_ = true;
    buildEntryCache();
    ARCHIVE_DEBUG("Zip archive '{}' opened, {} entries", name_, entry_cache_.size());
    return ZipError::Ok;
}

void ZipReader::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    cleanup();
}

// 条目查询

std::vector<std::string> ZipReader::listFiles() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> files;
    files.reserve(entry_cache_.size());
    for (const auto& [path, info] : entry_cache_) {
        files.push_back(path);
    }
    return files;
}

ZipError ZipReader::fileExists(std::string_view internal_path) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!is_open_) {
        return ZipError::NotOpen;
    }
    return entry_cache_.count(std::string(internal_path)) ? ZipError::Ok : ZipError::FileNotFound;
}

bool ZipReader::getEntryInfo(std::string_view internal_path, EntryInfo& info) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entry_cache_.find(std::string(internal_path));
    if (it == entry_cache_.end()) {
        return false;
    }
    info = it->second;
    return true;
}

// 读取操作

ZipError ZipReader::extractFile(std::string_view internal_path, std::string& content) {
    std::vector<uint8_t> data;
    ZipError result = extractFile(internal_path, data);
    if (result != ZipError::Ok) {
        return result;
    }
    content.assign(reinterpret_cast<const char*>(data.data()), data.size());
    return ZipError::Ok;
}

ZipError ZipReader::extractFile(std::string_view internal_path, std::vector<uint8_t>& data) {
    std::lock_guard<std::mutex> lock(mutex_);
    return extractFileInternal(internal_path, data);
}

ZipError ZipReader::extractFileInternal(std::string_view internal_path,
                                        std::vector<uint8_t>& data) const {
    if (!is_open_ || !unzip_handle_) {
        ARCHIVE_ERROR("Zip archive not opened for reading");
        return ZipError::NotOpen;
    }

    auto cached = entry_cache_.find(std::string(internal_path));
    if (cached == entry_cache_.end()) {
        ARCHIVE_DEBUG("Entry {} not found in '{}'", internal_path, name_);
        return ZipError::FileNotFound;
    }
    if (cached->second.uncompressed_size > kMaxEntrySize) {
        ARCHIVE_ERROR("Entry {} is too large: {} bytes", internal_path, cached->second.uncompressed_size);
        return ZipError::TooLarge;
    }

    const std::string path_str(internal_path);
    if (mz_zip_reader_locate_entry(unzip_handle_, path_str.c_str(), 0) != MZ_OK) {
        return ZipError::FileNotFound;
    }
    if (mz_zip_reader_entry_open(unzip_handle_) != MZ_OK) {
        ARCHIVE_ERROR("Failed to open entry: {}", internal_path);
        return ZipError::IoFail;
    }

    std::vector<uint8_t> buf(static_cast<size_t>(cached->second.uncompressed_size));
    size_t total = 0;
    while (total < buf.size()) {
        int32_t bytes_read = mz_zip_reader_entry_read(unzip_handle_, buf.data() + total,
                                                      static_cast<int32_t>(std::min<size_t>(buf.size() - total, 65536)));
        if (bytes_read <= 0) {
            break;
        }
        total += static_cast<size_t>(bytes_read);
    }
    mz_zip_reader_entry_close(unzip_handle_);

    if (total != buf.size()) {
        ARCHIVE_ERROR("Incomplete read for entry {}, expected: {} bytes, read: {} bytes",
                      internal_path, buf.size(), total);
        return ZipError::IoFail;
    }

    data.swap(buf);
    ARCHIVE_DEBUG("Extracted entry {}, size: {} bytes", internal_path, data.size());
    return ZipError::Ok;
}

// 内部辅助方法

void ZipReader::cleanup() {
    if (unzip_handle_) {
        mz_zip_reader_close(unzip_handle_);
        mz_zip_reader_delete(&unzip_handle_);
        unzip_handle_ = nullptr;
    }
    is_open_ = false;
    entry_cache_.clear();
}

void ZipReader::buildEntryCache() {
    entry_cache_.clear();

    if (mz_zip_reader_goto_first_entry(unzip_handle_) != MZ_OK) {
        return;
    }

    do {
        mz_zip_file* file_info = nullptr;
        if (mz_zip_reader_entry_get_info(unzip_handle_, &file_info) == MZ_OK && file_info) {
            if (file_info->filename && file_info->filename[0] != '\0') {
                EntryInfo info;
                info.path = file_info->filename;
                info.compressed_size = static_cast<uint64_t>(file_info->compressed_size);
                info.uncompressed_size = static_cast<uint64_t>(file_info->uncompressed_size);
                info.crc32 = file_info->crc;
                info.compression_method = file_info->compression_method;
                info.modified_date = file_info->modified_date;
                info.is_directory = info.path.back() == '/';
                entry_cache_[info.path] = info;
            }
        }
    } while (mz_zip_reader_goto_next_entry(unzip_handle_) == MZ_OK);
}

}} // namespace styleverify::archive
