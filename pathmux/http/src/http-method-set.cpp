#include "pathmux/http-method-set.hpp"

#include <algorithm>
#include <initializer_list>
#include <string_view>
#include <utility>

#include "pathmux/http-method.hpp"

namespace pathmux::http {

MethodSet::MethodSet(std::initializer_list<MethodKey> methods) {
  for (const MethodKey &method : methods) {
    _methods.insert(method);
  }
}

MethodSet &MethodSet::add(MethodKey method) {
  _methods.insert(std::move(method));
  return *this;
}

MethodSet &MethodSet::remove(const MethodKey &method) {
  _methods.erase(method);
  return *this;
}

MethodSet &MethodSet::mergeFrom(const MethodSet &other) {
  if (this != &other) {
    for (const MethodKey &method : other._methods) {
      _methods.insert(method);
    }
  }
  return *this;
}

bool MethodSet::contains(const MethodKey &method) const { return _methods.find(method) != _methods.end(); }

bool MethodSet::containsOrAny(std::string_view method) const noexcept {
  return std::ranges::any_of(_methods, [method](const MethodKey &key) { return key.isAny() || key.is(method); });
}

bool MethodSet::containsAny() const noexcept {
  return std::ranges::any_of(_methods, [](const MethodKey &key) { return key.isAny(); });
}

bool MethodSet::operator==(const MethodSet &other) const noexcept { return std::ranges::equal(_methods, other._methods); }

}  // namespace pathmux::http
