#pragma once

#include <ib/generator.hpp>
#include <ib/idl.hpp>

#include <string>
#include <vector>

namespace ib {

  // Umbrella header importing every generated Objective-C header, for use
  // as a Swift bridging header.
  class swift_bridging_header {
    generator gen_;
    fs::path folder_;
    std::string file_name_;

  public:
    explicit swift_bridging_header(generator gen);

    // Writes the banner and version declarations. Must run before the
    // declarations are dispatched.
    void
    begin();

    void
    generate_enum(const std::string& origin, const ident& id, const doc& d,
                  const enum_decl& e);

    void
    generate_record(const std::string& origin, const ident& id, const doc& d,
                    const std::vector<type_param>& params,
                    const record_decl& r);

    void
    generate_interface(const std::string& origin, const ident& id,
                       const doc& d, const std::vector<type_param>& params,
                       const interface_decl& i);

  private:
    void
    write_import(const ident& id);
  };

} // namespace ib
