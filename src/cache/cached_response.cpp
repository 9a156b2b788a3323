#include "cache/cached_response.h"

namespace prism {
namespace cache {

CachedResponse::Builder CachedResponse::builder() {
    return Builder();
}

std::shared_ptr<const CachedResponse> CachedResponse::Builder::build() {
    if (!cached_at_set_) {
        entry_.cached_at_ = Clock::now();
    }
    if (ttl_) {
        entry_.expires_at_ = entry_.cached_at_ + *ttl_;
    }
    // Private constructor: make_shared cannot reach it
    return std::shared_ptr<const CachedResponse>(new CachedResponse(std::move(entry_)));
}

} // namespace cache
} // namespace prism
