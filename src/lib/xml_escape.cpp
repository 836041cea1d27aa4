#include <rxml/xml_escape.hpp>

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace rxml {

  namespace {

    std::string
    lowercase(std::string_view s) {
      std::string out(s);
      std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
      });
      return out;
    }

    // Decodes one UTF-8 sequence starting at `pos`, advancing it. Malformed
    // bytes are passed through as single code points.
    char32_t
    next_code_point(std::string_view text, std::size_t& pos) {
      auto lead = static_cast<unsigned char>(text[pos]);
      std::size_t extra = 0;
      char32_t cp = lead;
      if (lead >= 0xF0 && lead < 0xF8) {
        extra = 3;
        cp = lead & 0x07;
      } else if (lead >= 0xE0 && lead < 0xF0) {
        extra = 2;
        cp = lead & 0x0F;
      } else if (lead >= 0xC0 && lead < 0xE0) {
        extra = 1;
        cp = lead & 0x1F;
      }
      if (extra == 0 || pos + extra >= text.size()) {
        ++pos;
        return lead;
      }
      for (std::size_t i = 1; i <= extra; ++i) {
        auto c = static_cast<unsigned char>(text[pos + i]);
        if ((c & 0xC0) != 0x80) {
          ++pos;
          return lead;
        }
        cp = (cp << 6) | (c & 0x3F);
      }
      pos += extra + 1;
      return cp;
    }

    void
    write_code_point(std::ostream& os, std::string_view text, std::size_t begin,
                     std::size_t end, char32_t cp, output_charset charset) {
      switch (charset) {
        case output_charset::utf8:
          os.write(text.data() + begin,
                   static_cast<std::streamsize>(end - begin));
          return;
        case output_charset::ascii:
          if (cp < 0x80) {
            os << static_cast<char>(cp);
            return;
          }
          break;
        case output_charset::latin1:
          if (cp < 0x100) {
            os << static_cast<char>(static_cast<unsigned char>(cp));
            return;
          }
          break;
      }
      os << "&#" << static_cast<unsigned long>(cp) << ';';
    }

    void
    escape(std::ostream& os, std::string_view text, output_charset charset,
           bool in_attribute) {
      std::size_t pos = 0;
      while (pos < text.size()) {
        char c = text[pos];
        switch (c) {
          case '<':
            os << "&lt;";
            ++pos;
            continue;
          case '>':
            os << "&gt;";
            ++pos;
            continue;
          case '&':
            os << "&amp;";
            ++pos;
            continue;
          case '\r':
            os << "&#13;";
            ++pos;
            continue;
          default:
            break;
        }
        if (in_attribute) {
          if (c == '"') {
            os << "&quot;";
            ++pos;
            continue;
          }
          if (c == '\n' || c == '\t') {
            os << (c == '\n' ? "&#10;" : "&#9;");
            ++pos;
            continue;
          }
        }
        std::size_t begin = pos;
        char32_t cp = next_code_point(text, pos);
        write_code_point(os, text, begin, pos, cp, charset);
      }
    }

  } // namespace

  output_charset
  charset_from_name(std::string_view name) {
    auto n = lowercase(name);
    if (n == "utf-8" || n == "utf8") { return output_charset::utf8; }
    if (n == "us-ascii" || n == "ascii") { return output_charset::ascii; }
    if (n == "iso-8859-1" || n == "latin1" || n == "latin-1") {
      return output_charset::latin1;
    }
    throw std::invalid_argument("unsupported output encoding '" +
                                std::string(name) + "'");
  }

  std::string
  charset_name(output_charset charset) {
    switch (charset) {
      case output_charset::utf8:
        return "UTF-8";
      case output_charset::ascii:
        return "US-ASCII";
      case output_charset::latin1:
        return "ISO-8859-1";
    }
    return "UTF-8";
  }

  void
  escape_text(std::ostream& os, std::string_view text, output_charset charset) {
    escape(os, text, charset, false);
  }

  void
  escape_attribute(std::ostream& os, std::string_view text,
                   output_charset charset) {
    escape(os, text, charset, true);
  }

} // namespace rxml
