#include <rxml/errors.hpp>
#include <rxml/path.hpp>

#include <algorithm>

namespace rxml {

  namespace {

    path_segment
    parse_segment(std::string_view text, std::string_view whole) {
      if (text.front() == ':') { text.remove_prefix(1); }

      path_segment seg;
      auto colon = text.find(':');
      if (colon == std::string_view::npos) {
        seg.local_name = std::string(text);
      } else {
        if (text.find(':', colon + 1) != std::string_view::npos) {
          throw path_syntax_error("more than one namespace prefix in step '" +
                                  std::string(text) + "' of path '" +
                                  std::string(whole) + "'");
        }
        seg.prefix = std::string(text.substr(0, colon));
        seg.local_name = std::string(text.substr(colon + 1));
      }

      if (seg.local_name.empty()) {
        throw path_syntax_error("empty name in path '" + std::string(whole) +
                                "'");
      }
      return seg;
    }

  } // namespace

  path_expression
  parse_path(std::string_view text) {
    auto at = text.find('@');
    if (at != std::string_view::npos &&
        text.find('@', at + 1) != std::string_view::npos) {
      throw path_syntax_error("only one '@' allowed in path '" +
                              std::string(text) + "'");
    }

    std::optional<path_segment> attribute;
    std::string_view elements = text;
    if (at != std::string_view::npos) {
      auto attr_text = text.substr(at + 1);
      if (attr_text.empty() || attr_text.find('/') != std::string_view::npos) {
        throw path_syntax_error("malformed attribute in path '" +
                                std::string(text) + "'");
      }
      attribute = parse_segment(attr_text, text);
      elements = text.substr(0, at);
    }

    std::vector<path_segment> segments;
    std::size_t pos = 0;
    while (pos <= elements.size()) {
      auto slash = elements.find('/', pos);
      if (slash == std::string_view::npos) { slash = elements.size(); }
      auto step = elements.substr(pos, slash - pos);
      if (!step.empty()) { segments.push_back(parse_segment(step, text)); }
      pos = slash + 1;
    }

    return path_expression{std::move(segments), std::move(attribute)};
  }

  bool
  path_expression::is_strict_prefix_of(const path_expression& other) const {
    return segments_.size() < other.segments_.size() &&
           is_prefix_of(other.segments_);
  }

  bool
  path_expression::is_prefix_of(
      const std::vector<path_segment>& segments) const {
    if (segments_.size() > segments.size()) { return false; }
    return std::equal(segments_.begin(), segments_.end(), segments.begin());
  }

  path_expression
  path_expression::parent() const {
    std::vector<path_segment> segments = segments_;
    if (!segments.empty()) { segments.pop_back(); }
    return path_expression{std::move(segments), std::nullopt};
  }

  std::string
  path_expression::str() const {
    std::string out;
    for (const auto& seg : segments_) {
      out += '/';
      if (!seg.prefix.empty()) { out += seg.prefix + ':'; }
      out += seg.local_name;
    }
    if (attribute_) {
      out += "/@";
      if (!attribute_->prefix.empty()) { out += attribute_->prefix + ':'; }
      out += attribute_->local_name;
    }
    if (out.empty()) { out = "/"; }
    return out;
  }

} // namespace rxml
