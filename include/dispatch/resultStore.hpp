#pragma once

#include <any>
#include <optional>
#include <string>
#include <vector>

namespace luxer {

/**
 * Return values of handlers, in the order they were recorded. Typed queries
 * skip values of other types.
 */
class ResultStore {
public:
  void add(const std::string &handlerId, std::any value) {
    entries.push_back({handlerId, std::move(value)});
  }

  template <typename T>
  std::optional<T> last(const std::string &handlerId) const {
    for (auto it = entries.rbegin(); it != entries.rend(); ++it) {
      if (it->handlerId == handlerId) {
        if (const T *value = std::any_cast<T>(&it->value)) {
          return *value;
        }
      }
    }
    return std::nullopt;
  }

  template <typename T>
  std::vector<T> all(const std::string &handlerId) const {
    std::vector<T> result;
    for (const Entry &entry : entries) {
      if (entry.handlerId == handlerId) {
        if (const T *value = std::any_cast<T>(&entry.value)) {
          result.push_back(*value);
        }
      }
    }
    return result;
  }

  template <typename T> std::optional<T> lastOfType() const {
    for (auto it = entries.rbegin(); it != entries.rend(); ++it) {
      if (const T *value = std::any_cast<T>(&it->value)) {
        return *value;
      }
    }
    return std::nullopt;
  }

  template <typename T> std::vector<T> allOfType() const {
    std::vector<T> result;
    for (const Entry &entry : entries) {
      if (const T *value = std::any_cast<T>(&entry.value)) {
        result.push_back(*value);
      }
    }
    return result;
  }

  size_t count(const std::string &handlerId) const {
    size_t total = 0;
    for (const Entry &entry : entries) {
      if (entry.handlerId == handlerId) {
        total++;
      }
    }
    return total;
  }

  size_t size() const { return entries.size(); }
  void clear() { entries.clear(); }

private:
  struct Entry {
    std::string handlerId;
    std::any value;
  };

  std::vector<Entry> entries;
};

} // namespace luxer
