#pragma once

#include <rxml/xml_escape.hpp>
#include <rxml/xml_writer.hpp>

#include <memory>
#include <ostream>

namespace rxml {

  struct writer_options {
    output_charset charset = output_charset::utf8;
    bool pretty = true;
    bool declaration = true;
  };

  // Serializes writer calls as XML text. With `pretty`, element-only
  // content is indented two spaces per level; elements holding text are
  // written inline. The declaration is emitted before the first element.
  class ostream_writer : public xml_writer {
  public:
    explicit ostream_writer(std::ostream& os, writer_options options = {});
    ~ostream_writer() override;

    ostream_writer(const ostream_writer&) = delete;
    ostream_writer&
    operator=(const ostream_writer&) = delete;
    ostream_writer(ostream_writer&&) noexcept;
    ostream_writer&
    operator=(ostream_writer&&) noexcept;

    void
    start_element(const qname& name) override;

    void
    end_element() override;

    void
    attribute(const qname& name, std::string_view value) override;

    void
    characters(std::string_view text) override;

    void
    namespace_declaration(std::string_view prefix,
                          std::string_view uri) override;

    bool
    in_scope(std::string_view prefix, std::string_view uri) const override;

    std::optional<std::string>
    prefix_for(std::string_view uri, bool for_attribute) const override;

  private:
    struct impl;
    std::unique_ptr<impl> impl_;
  };

} // namespace rxml
