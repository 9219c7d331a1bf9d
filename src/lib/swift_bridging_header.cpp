#include <ib/swift_bridging_header.hpp>

#include <utility>

namespace ib {

  swift_bridging_header::swift_bridging_header(generator gen)
      : gen_(std::move(gen)) {
    const auto& objc = gen_.options().objc;
    folder_ = objc.header_out.value_or(objc.out.value_or(fs::path{}));
    file_name_ = objc.swift_bridging_header_name.value_or("") + ".h";
  }

  void
  swift_bridging_header::begin() {
    const auto& s = gen_.options();
    const auto name = s.objc.swift_bridging_header_name.value_or("");

    // Version symbols must be valid C identifiers.
    auto symbol = name;
    for (auto& c : symbol)
      if (c == '-' || c == '.') c = '_';

    gen_.files().create_file(folder_, file_name_, [&](indent_writer& w) {
      w.wl("// AUTOGENERATED FILE - DO NOT MODIFY!");
      w.wl("// This file was generated by ib from " + s.idl_file_name);
      w.wl();
      w.wl("#import <Foundation/Foundation.h>");
      w.wl();
      w.wl("//! Project version number for " + name + ".");
      w.wl("FOUNDATION_EXPORT double " + symbol + "VersionNumber;");
      w.wl();
      w.wl("//! Project version string for " + name + ".");
      w.wl("FOUNDATION_EXPORT const unsigned char " + symbol +
           "VersionString[];");
      w.wl();
    });
  }

  void
  swift_bridging_header::generate_enum(const std::string&, const ident& id,
                                       const doc&, const enum_decl&) {
    write_import(id);
  }

  void
  swift_bridging_header::generate_record(const std::string&, const ident& id,
                                         const doc&,
                                         const std::vector<type_param>&,
                                         const record_decl&) {
    write_import(id);
  }

  void
  swift_bridging_header::generate_interface(const std::string&,
                                            const ident& id, const doc&,
                                            const std::vector<type_param>&,
                                            const interface_decl&) {
    write_import(id);
  }

  void
  swift_bridging_header::write_import(const ident& id) {
    const auto& objc = gen_.options().objc;
    auto header = objc.include_prefix + objc.file_ident(id.name()) + "." +
                  objc.header_ext;
    gen_.files().append_to_file(folder_, file_name_, [&](indent_writer& w) {
      w.wl("#import " + q(header));
    });
  }

} // namespace ib
