#ifndef PACKAGES_VSFIELD_CPP_INCLUDE_VSFIELD_SYSTEMS_STATS_TRACKER_HPP_
#define PACKAGES_VSFIELD_CPP_INCLUDE_VSFIELD_SYSTEMS_STATS_TRACKER_HPP_

#include <cstdint>
#include <string>
#include <unordered_map>

namespace vsfield {

// Named counters of what a field has encoded and moved. Operations count into a scratch tracker and
// merge it into the field's tracker only once they are accepted.
class StatsTracker {
private:
  std::unordered_map<std::string, int64_t> _stats;

public:
  StatsTracker() : _stats() {}

  void add(const std::string& key, int64_t amount) {
    _stats[key] += amount;
  }

  void incr(const std::string& key) {
    add(key, 1);
  }

  int64_t get(const std::string& key) const {
    auto it = _stats.find(key);
    if (it == _stats.end()) {
      return 0;
    }
    return it->second;
  }

  void merge(const StatsTracker& other) {
    for (const auto& [key, amount] : other._stats) {
      _stats[key] += amount;
    }
  }

  // Convert to map for Python API
  const std::unordered_map<std::string, int64_t>& to_dict() const {
    return _stats;
  }

  void reset() {
    _stats.clear();
  }
};

}  // namespace vsfield

#endif  // PACKAGES_VSFIELD_CPP_INCLUDE_VSFIELD_SYSTEMS_STATS_TRACKER_HPP_
