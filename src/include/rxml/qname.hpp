#pragma once

#include <compare>
#include <functional>
#include <ostream>
#include <string>

namespace rxml {

  // An element or attribute name with its resolved namespace URI. An empty
  // URI means the name is unqualified.
  class qname {
    std::string namespace_uri_;
    std::string local_name_;

  public:
    qname() = default;

    explicit qname(std::string local_name)
        : local_name_(std::move(local_name)) {}

    qname(std::string namespace_uri, std::string local_name)
        : namespace_uri_(std::move(namespace_uri)),
          local_name_(std::move(local_name)) {}

    const std::string&
    namespace_uri() const {
      return namespace_uri_;
    }

    const std::string&
    local_name() const {
      return local_name_;
    }

    bool
    qualified() const {
      return !namespace_uri_.empty();
    }

    // Clark notation: "{uri}local", or "local" when unqualified.
    std::string
    str() const {
      if (namespace_uri_.empty()) { return local_name_; }
      return '{' + namespace_uri_ + '}' + local_name_;
    }

    auto
    operator<=>(const qname&) const = default;

    bool
    operator==(const qname&) const = default;

    friend std::ostream&
    operator<<(std::ostream& os, const qname& q) {
      return os << q.str();
    }
  };

} // namespace rxml

template <>
struct std::hash<rxml::qname> {
  std::size_t
  operator()(const rxml::qname& q) const noexcept {
    std::size_t h1 = std::hash<std::string>{}(q.namespace_uri());
    std::size_t h2 = std::hash<std::string>{}(q.local_name());
    return h1 ^ (h2 << 1);
  }
};
