#pragma once

#include <ostream>
#include <string>
#include <string_view>

namespace rxml {

  // Character sets an output document can be encoded in.
  enum class output_charset {
    utf8,
    ascii,
    latin1,
  };

  // Maps an encoding name (case-insensitive) to a charset. Throws
  // std::invalid_argument for unsupported names.
  output_charset
  charset_from_name(std::string_view name);

  // Canonical name written into the XML declaration.
  std::string
  charset_name(output_charset charset);

  // Writes UTF-8 `text` as element content in `charset`. Code points the
  // charset cannot hold become numeric character references.
  void
  escape_text(std::ostream& os, std::string_view text,
              output_charset charset = output_charset::utf8);

  // Like escape_text, also escaping quotes and whitespace that attribute
  // value normalization would otherwise fold.
  void
  escape_attribute(std::ostream& os, std::string_view text,
                   output_charset charset = output_charset::utf8);

} // namespace rxml
