#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace pc::check {

// Multiset of paths: each take() cancels one occurrence
class PathCounter {
public:
    PathCounter() = default;
    explicit PathCounter(const std::vector<std::string>& paths);

    void add(const std::string& path);

    // Removes one occurrence; false if none was left
    bool take(const std::string& path);

    // Remaining occurrences, byte-wise sorted, repeated per count
    [[nodiscard]] std::vector<std::string> remaining() const;
    [[nodiscard]] std::size_t size() const { return size_; }

private:
    std::map<std::string, std::size_t> counts_;
    std::size_t size_ = 0;
};

}
