#include "core/filter_context.h"
#include "core/projection_error.h"
#include "utils/logger.h"

#include <algorithm>
#include <cstdint>
#include <cctype>
#include <iomanip>
#include <random>
#include <sstream>
#include <stdexcept>

namespace prism {
namespace core {

namespace {

void requireFieldName(const std::string& field_name) {
    bool blank = std::all_of(field_name.begin(), field_name.end(),
                             [](unsigned char c) { return std::isspace(c); });
    if (blank) {
        throw std::invalid_argument("field_name must not be blank");
    }
}

} // namespace

FilterContext::FilterContext(int max_depth, bool cycle_detection, std::optional<std::string> trace_id)
    : max_depth_(max_depth)
    , cycle_detection_(cycle_detection)
    , trace_id_(std::move(trace_id)) {
    path_stack_.reserve(static_cast<size_t>(std::max(max_depth_, 0)));
}

void FilterContext::descend(const std::string& field_name) {
    requireFieldName(field_name);

    int new_depth = getCurrentDepth() + 1;
    if (new_depth > max_depth_) {
        throw DepthExceeded(buildPath(field_name), max_depth_, new_depth);
    }

    if (cycle_detection_) {
        std::string prospective = buildPath(field_name);
        if (visited_paths_.count(prospective) > 0) {
            throw CycleDetected(prospective);
        }
        visited_paths_.insert(std::move(prospective));
    }

    path_stack_.push_back(field_name);
}

void FilterContext::ascend() {
    if (path_stack_.empty()) {
        PRISM_WARN("FilterContext::ascend called with empty path stack (trace={})",
                   trace_id_.value_or("-"));
        return;
    }

    if (cycle_detection_) {
        visited_paths_.erase(materializePath());
    }
    path_stack_.pop_back();
}

std::string FilterContext::buildPath(const std::string& field_name) const {
    requireFieldName(field_name);
    if (path_stack_.empty()) {
        return field_name;
    }
    return materializePath() + "." + field_name;
}

std::string FilterContext::materializePath() const {
    std::string path;
    for (const auto& segment : path_stack_) {
        if (!path.empty()) path += '.';
        path += segment;
    }
    return path;
}

std::string FilterContext::generateTraceId() {
    thread_local std::mt19937 rng{std::random_device{}()};
    std::uniform_int_distribution<uint32_t> dist;
    std::ostringstream oss;
    oss << std::hex << std::setw(8) << std::setfill('0') << dist(rng);
    return oss.str();
}

} // namespace core
} // namespace prism
