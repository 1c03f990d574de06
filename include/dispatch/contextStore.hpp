#pragma once

#include <any>
#include <string>
#include <unordered_map>
#include <vector>

namespace luxer {

/**
 * Keyed values shared by the handlers of one top-level traversal.
 * Lookups with the wrong type behave like missing keys.
 */
class ContextStore {
public:
  template <typename T> void set(const std::string &key, T value) {
    values[key] = std::move(value);
  }

  template <typename T> T *get(const std::string &key) {
    auto it = values.find(key);
    return it == values.end() ? nullptr : std::any_cast<T>(&it->second);
  }

  template <typename T> const T *get(const std::string &key) const {
    auto it = values.find(key);
    return it == values.end() ? nullptr : std::any_cast<T>(&it->second);
  }

  template <typename T> T getOr(const std::string &key, T fallback) const {
    const T *value = get<T>(key);
    return value ? *value : fallback;
  }

  // Existing value of type T, or the factory's result stored under the key
  template <typename T, typename Factory>
  T &getOrAdd(const std::string &key, Factory factory) {
    if (T *value = get<T>(key)) {
      return *value;
    }
    values[key] = T(factory());
    return *std::any_cast<T>(&values[key]);
  }

  // Lists are stored as std::vector<T>
  template <typename T> void append(const std::string &key, T item) {
    getOrAdd<std::vector<T>>(key, [] { return std::vector<T>{}; })
        .push_back(std::move(item));
  }

  template <typename T> std::vector<T> list(const std::string &key) const {
    const std::vector<T> *items = get<std::vector<T>>(key);
    return items ? *items : std::vector<T>{};
  }

  bool has(const std::string &key) const { return values.count(key) > 0; }
  bool remove(const std::string &key) { return values.erase(key) > 0; }
  void clear() { values.clear(); }
  size_t size() const { return values.size(); }

private:
  std::unordered_map<std::string, std::any> values;
};

} // namespace luxer
