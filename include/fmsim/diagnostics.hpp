#pragma once
#include <cstdint>
#include <map>
#include <set>
#include <string>

namespace fmsim {

// Named counters and one-shot gates, owned by whoever runs the simulation.
class DiagnosticSink {
public:
  void increment(const std::string& name, std::uint64_t by = 1) { counters_[name] += by; }

  std::uint64_t count(const std::string& name) const {
    auto it = counters_.find(name);
    return it == counters_.end() ? 0 : it->second;
  }

  // True the first time a key is seen.
  bool first_time(const std::string& key) { return seen_.insert(key).second; }

  const std::map<std::string, std::uint64_t>& counters() const { return counters_; }

  void clear() { counters_.clear(); seen_.clear(); }

private:
  std::map<std::string, std::uint64_t> counters_;
  std::set<std::string> seen_;
};

} // namespace fmsim
