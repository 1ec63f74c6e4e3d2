#include "tabexport/core/FormatRepository.hpp"

namespace tabexport {
namespace core {

FormatRepository::FormatRepository() {
    formats_.reserve(32);
    hash_to_id_.reserve(32);
    
    auto default_format = std::make_shared<const FormatDescriptor>(FormatDescriptor::getDefault());
    formats_.push_back(default_format);
    hash_to_id_[default_format->hash()] = DEFAULT_FORMAT_ID;
}

int FormatRepository::addFormat(const FormatDescriptor& format) {
    ++total_requests_;
    
    int existing_id = findFormatId(format);
    if (existing_id >= 0) {
        ++cache_hits_;
        return existing_id;
    }
    
    int new_id = static_cast<int>(formats_.size());
    formats_.push_back(std::make_shared<const FormatDescriptor>(format));
    hash_to_id_.emplace(format.hash(), new_id);
    return new_id;
}

int FormatRepository::findFormatId(const FormatDescriptor& format) const {
    auto it = hash_to_id_.find(format.hash());
    if (it != hash_to_id_.end() && *formats_[it->second] == format) {
        return it->second;
    }
    
    // 哈希冲突：线性搜索
    for (size_t i = 0; i < formats_.size(); ++i) {
        if (*formats_[i] == format) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

std::shared_ptr<const FormatDescriptor> FormatRepository::getFormat(int id) const {
    if (!isValidFormatId(id)) {
        return formats_[DEFAULT_FORMAT_ID];
    }
    return formats_[id];
}

void FormatRepository::clear() {
    auto default_format = formats_[DEFAULT_FORMAT_ID];
    
    formats_.clear();
    hash_to_id_.clear();
    
    formats_.push_back(default_format);
    hash_to_id_[default_format->hash()] = DEFAULT_FORMAT_ID;
    
    total_requests_ = 0;
    cache_hits_ = 0;
}

double FormatRepository::getCacheHitRate() const {
    if (total_requests_ == 0) return 0.0;
    return static_cast<double>(cache_hits_) / static_cast<double>(total_requests_);
}

}} // namespace tabexport::core
