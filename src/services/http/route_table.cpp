/// @file route_table.cpp
/// @brief RouteTable implementation.

#include "eks/service/route_table.hpp"

#include <algorithm>

namespace eks::service {

namespace {

std::vector<std::string_view> splitPath(std::string_view path) {
    std::vector<std::string_view> segments;
    if (!path.empty() && path.front() == '/') {
        path.remove_prefix(1);
    }
    while (true) {
        auto slash = path.find('/');
        segments.push_back(path.substr(0, slash));
        if (slash == std::string_view::npos) {
            break;
        }
        path.remove_prefix(slash + 1);
    }
    return segments;
}

bool isCapture(std::string_view segment) {
    return segment.size() > 2 && segment.front() == '{' && segment.back() == '}';
}

/// Match @p path against @p pattern; false on mismatch or a bad escape.
bool matchPattern(std::string_view pattern, std::string_view path,
                  std::unordered_map<std::string, std::string>& params) {
    auto want = splitPath(pattern);
    auto have = splitPath(path);
    if (want.size() != have.size()) {
        return false;
    }

    std::unordered_map<std::string, std::string> captured;
    for (std::size_t i = 0; i < want.size(); ++i) {
        if (isCapture(want[i])) {
            if (have[i].empty()) {
                return false;
            }
            auto decoded = percentDecode(have[i]);
            if (!decoded) {
                return false;
            }
            captured.emplace(std::string(want[i].substr(1, want[i].size() - 2)),
                             std::move(*decoded));
        } else if (want[i] != have[i]) {
            return false;
        }
    }
    params = std::move(captured);
    return true;
}

}  // anonymous namespace

void RouteTable::addRoute(std::string method, std::string pattern, RouteHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    routes_.push_back(RouteEntry{std::move(method), std::move(pattern), std::move(handler)});
}

RouteMatch RouteTable::resolve(std::string_view method, std::string_view path) const {
    std::lock_guard<std::mutex> lock(mutex_);

    RouteMatch result;
    for (const auto& route : routes_) {
        std::unordered_map<std::string, std::string> params;
        if (!matchPattern(route.pattern, path, params)) {
            continue;
        }
        if (route.method == method) {
            result.status = RouteMatch::Status::Matched;
            result.handler = route.handler;
            result.params = std::move(params);
            result.allowedMethods.clear();
            return result;
        }
        result.status = RouteMatch::Status::MethodNotAllowed;
        if (std::find(result.allowedMethods.begin(), result.allowedMethods.end(),
                      route.method) == result.allowedMethods.end()) {
            result.allowedMethods.push_back(route.method);
        }
    }
    return result;
}

std::size_t RouteTable::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return routes_.size();
}

void RouteTable::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    routes_.clear();
}

}  // namespace eks::service
