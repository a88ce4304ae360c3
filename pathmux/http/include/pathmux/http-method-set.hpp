#pragma once

#include <cstddef>
#include <initializer_list>
#include <string_view>

#include "pathmux/flatset.hpp"
#include "pathmux/http-method.hpp"

namespace pathmux::http {

// Set of method keys, possibly including the Any wildcard.
// Used both to declare which methods a route accepts and to scope catch-all and default handlers.
// MethodSet has value semantics: copies are deep and independent.
class MethodSet {
 public:
  using container_type = FlatSet<MethodKey>;
  using const_iterator = container_type::const_iterator;

  MethodSet() noexcept = default;

  // Builds a set from method names or keys, for instance MethodSet{"GET", "PATCH"}.
  // Throws std::invalid_argument if a name is empty or reserved.
  MethodSet(std::initializer_list<MethodKey> methods);

  [[nodiscard]] static MethodSet Get() { return MethodSet{MethodKey(MethodGet)}; }
  [[nodiscard]] static MethodSet Post() { return MethodSet{MethodKey(MethodPost)}; }
  [[nodiscard]] static MethodSet Put() { return MethodSet{MethodKey(MethodPut)}; }
  [[nodiscard]] static MethodSet Delete() { return MethodSet{MethodKey(MethodDelete)}; }

  // Set holding only the wildcard, accepting every method.
  [[nodiscard]] static MethodSet Any() { return MethodSet{MethodKey::Any()}; }

  // Adds the method to the set. Adding an existing key is a no-op.
  MethodSet &add(MethodKey method);

  // Removes the method from the set. Removing an absent key is a no-op.
  MethodSet &remove(const MethodKey &method);

  MethodSet &withGet() { return add(MethodKey(MethodGet)); }
  MethodSet &withPost() { return add(MethodKey(MethodPost)); }
  MethodSet &withPut() { return add(MethodKey(MethodPut)); }
  MethodSet &withDelete() { return add(MethodKey(MethodDelete)); }
  MethodSet &withAny() { return add(MethodKey::Any()); }

  // In-place union with other.
  MethodSet &mergeFrom(const MethodSet &other);

  // Tells whether the exact key is a member (the wildcard is not expanded).
  [[nodiscard]] bool contains(const MethodKey &method) const;

  // Tells whether the request method is accepted by this set: true if it is a member or if the wildcard is.
  [[nodiscard]] bool containsOrAny(std::string_view method) const noexcept;

  // Tells whether the wildcard is a member.
  [[nodiscard]] bool containsAny() const noexcept;

  [[nodiscard]] std::size_t size() const noexcept { return _methods.size(); }

  [[nodiscard]] bool empty() const noexcept { return _methods.empty(); }

  [[nodiscard]] const_iterator begin() const noexcept { return _methods.begin(); }
  [[nodiscard]] const_iterator end() const noexcept { return _methods.end(); }

  bool operator==(const MethodSet &other) const noexcept;

 private:
  container_type _methods;
};

}  // namespace pathmux::http
