#pragma once

#include <cstddef>
#include <string>
#include <utility>

namespace blobxl {
namespace storage {

/**
 * @brief 保存机密文本（连接字符串、账户密钥）
 *
 * 析构、赋值时把旧内容清零。禁止拷贝，只能移动。
 */
class SecureString {
public:
    SecureString() = default;
    explicit SecureString(std::string value) : data_(std::move(value)) {}

    ~SecureString() { wipe(); }

    SecureString(const SecureString&) = delete;
    SecureString& operator=(const SecureString&) = delete;

    SecureString(SecureString&& other) noexcept : data_(std::move(other.data_)) {
        other.wipe();
    }

    SecureString& operator=(SecureString&& other) noexcept {
        if (this != &other) {
            wipe();
            data_ = std::move(other.data_);
            other.wipe();
        }
        return *this;
    }

    const std::string& str() const { return data_; }
    const char* c_str() const { return data_.c_str(); }
    size_t size() const { return data_.size(); }
    bool empty() const { return data_.empty(); }

    void clear() { wipe(); }

private:
    std::string data_;

    void wipe() noexcept {
        // volatile 写入避免被优化掉
        volatile char* p = data_.empty() ? nullptr : &data_[0];
        for (size_t i = 0; i < data_.size(); ++i) {
            p[i] = '\0';
        }
        data_.clear();
    }
};

}} // namespace blobxl::storage
