// QUORUM - Database Implementation
// Copyright (c) 2024 QUORUM Developers
// MIT License

#include "quorum/db/database.h"

#include <iterator>
#include <sstream>

namespace quorum {
namespace db {

std::string Status::ToString() const {
    if (ok()) return "OK";
    std::string result;
    switch (code_) {
        case NOT_FOUND: result = "NotFound: "; break;
        case CORRUPTION: result = "Corruption: "; break;
        case NOT_SUPPORTED: result = "NotSupported: "; break;
        case INVALID_ARGUMENT: result = "InvalidArgument: "; break;
        case IO_ERROR: result = "IOError: "; break;
        default: result = "Unknown: "; break;
    }
    return result + message_;
}

// ============================================================================
// MemoryIterator
// ============================================================================

namespace {

class MemoryIterator : public Iterator {
public:
    explicit MemoryIterator(std::map<std::string, std::string> snapshot)
        : data_(std::move(snapshot)), iter_(data_.end()), valid_(false) {}

    bool Valid() const override { return valid_ && iter_ != data_.end(); }

    void SeekToFirst() override {
        iter_ = data_.begin();
        valid_ = (iter_ != data_.end());
    }

    void SeekToLast() override {
        if (data_.empty()) {
            iter_ = data_.end();
            valid_ = false;
        } else {
            iter_ = std::prev(data_.end());
            valid_ = true;
        }
    }

    void Seek(const Slice& target) override {
        iter_ = data_.lower_bound(target.ToString());
        valid_ = (iter_ != data_.end());
    }

    void Next() override {
        if (Valid()) {
            ++iter_;
            valid_ = (iter_ != data_.end());
        }
    }

    void Prev() override {
        if (!Valid() || iter_ == data_.begin()) {
            valid_ = false;
            return;
        }
        --iter_;
    }

    Slice key() const override { return Slice(iter_->first); }
    Slice value() const override { return Slice(iter_->second); }
    Status status() const override { return Status::Ok(); }

private:
    std::map<std::string, std::string> data_;
    std::map<std::string, std::string>::const_iterator iter_;
    bool valid_;
};

} // namespace

// ============================================================================
// MemoryDatabase
// ============================================================================

Status MemoryDatabase::Get(const ReadOptions& /*options*/, const Slice& key, std::string* value) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = data_.find(key.ToString());
    if (it == data_.end()) {
        return Status::NotFound(key.ToString());
    }
    *value = it->second;
    return Status::Ok();
}

Status MemoryDatabase::Put(const WriteOptions& /*options*/, const Slice& key, const Slice& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    data_[key.ToString()] = value.ToString();
    return Status::Ok();
}

Status MemoryDatabase::Delete(const WriteOptions& /*options*/, const Slice& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    data_.erase(key.ToString());
    return Status::Ok();
}

Status MemoryDatabase::Write(const WriteOptions& /*options*/, WriteBatch* batch) {
    if (batch == nullptr) {
        return Status::InvalidArgument("null batch");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    batch->Iterate([this](const std::string& key, const std::optional<std::string>& value) {
        if (value) {
            data_[key] = *value;
        } else {
            data_.erase(key);
        }
    });
    return Status::Ok();
}

std::unique_ptr<Iterator> MemoryDatabase::NewIterator(const ReadOptions& /*options*/) {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::make_unique<MemoryIterator>(data_);
}

std::string MemoryDatabase::GetStats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t bytes = 0;
    for (const auto& [key, value] : data_) {
        bytes += key.size() + value.size();
    }
    std::ostringstream ss;
    ss << "memory: " << data_.size() << " keys, " << bytes << " bytes";
    return ss.str();
}

size_t MemoryDatabase::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return data_.size();
}

void MemoryDatabase::Clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    data_.clear();
}

} // namespace db
} // namespace quorum
