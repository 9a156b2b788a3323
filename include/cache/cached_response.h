#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace prism {
namespace cache {

/**
 * @brief Cached full (unprojected) response, its media type and validators
 *
 * Projected variants are never cached. Immutable after build(); the manager
 * hands out shared_ptr<const CachedResponse> so a hit never copies the document.
 */
class CachedResponse {
public:
    using Clock = std::chrono::system_clock;
    using TimePoint = Clock::time_point;

    class Builder;

    const nlohmann::ordered_json& getFullResponse() const { return full_response_; }
    const std::string& getContentType() const { return content_type_; }
    const std::optional<std::string>& getEtag() const { return etag_; }
    const std::optional<TimePoint>& getLastModified() const { return last_modified_; }
    TimePoint getCachedAt() const { return cached_at_; }
    TimePoint getExpiresAt() const { return expires_at_; }

    // Expired at and after the expiry instant
    bool isExpired(TimePoint now = Clock::now()) const { return now >= expires_at_; }
    bool hasConditionalHeaders() const { return etag_.has_value() || last_modified_.has_value(); }

    static Builder builder();

private:
    CachedResponse() = default;

    nlohmann::ordered_json full_response_;
    std::string content_type_ = "application/json";
    std::optional<std::string> etag_;
    std::optional<TimePoint> last_modified_;
    TimePoint cached_at_{};
    TimePoint expires_at_{TimePoint::max()};
};

class CachedResponse::Builder {
public:
    Builder& fullResponse(nlohmann::ordered_json response) { entry_.full_response_ = std::move(response); return *this; }
    Builder& contentType(std::string type) { entry_.content_type_ = std::move(type); return *this; }
    Builder& etag(std::string tag) { entry_.etag_ = std::move(tag); return *this; }
    Builder& lastModified(TimePoint ts) { entry_.last_modified_ = ts; return *this; }
    Builder& cachedAt(TimePoint ts) { entry_.cached_at_ = ts; cached_at_set_ = true; return *this; }
    Builder& expiresAt(TimePoint ts) { entry_.expires_at_ = ts; return *this; }
    // Relative to cachedAt (or now if cachedAt was not set)
    Builder& ttl(std::chrono::seconds ttl) { ttl_ = ttl; return *this; }

    std::shared_ptr<const CachedResponse> build();

private:
    CachedResponse entry_;
    bool cached_at_set_ = false;
    std::optional<std::chrono::seconds> ttl_;
};

} // namespace cache
} // namespace prism
