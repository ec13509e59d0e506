#include "check/PathCounter.hpp"

namespace pc::check {

PathCounter::PathCounter(const std::vector<std::string>& paths) {
    for (const auto& p : paths) add(p);
}

void PathCounter::add(const std::string& path) {
    ++counts_[path];
    ++size_;
}

bool PathCounter::take(const std::string& path) {
    const auto it = counts_.find(path);
    if (it == counts_.end()) return false;
    if (--it->second == 0) counts_.erase(it);
    --size_;
    return true;
}

std::vector<std::string> PathCounter::remaining() const {
    std::vector<std::string> out;
    out.reserve(size_);
    for (const auto& [path, n] : counts_) out.insert(out.end(), n, path);
    return out;
}

}
