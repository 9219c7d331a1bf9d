#include <ib/generator.hpp>

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

using namespace ib;

namespace {

  // Records every hook invocation as "<kind>:<name>".
  struct recording_backend {
    std::vector<std::string> calls;
    std::vector<std::size_t> param_counts;

    void
    generate_enum(const std::string& origin, const ident& id, const doc&,
                  const enum_decl&) {
      calls.push_back("enum:" + id.name() + "@" + origin);
    }

    void
    generate_record(const std::string&, const ident& id, const doc&,
                    const std::vector<type_param>& params,
                    const record_decl&) {
      calls.push_back("record:" + id.name());
      param_counts.push_back(params.size());
    }

    void
    generate_interface(const std::string&, const ident& id, const doc&,
                       const std::vector<type_param>& params,
                       const interface_decl&) {
      calls.push_back("interface:" + id.name());
      param_counts.push_back(params.size());
    }
  };

  static_assert(backend<recording_backend>);

  struct incomplete_backend {
    void
    generate_enum(const std::string&, const ident&, const doc&,
                  const enum_decl&) {}
  };

  static_assert(!backend<incomplete_backend>);

  type_decl
  make_decl(std::string name, type_body body, bool imported = false) {
    type_decl td;
    td.ident = ident(std::move(name));
    td.origin = "test.idl";
    td.body = std::move(body);
    td.imported = imported;
    return td;
  }

  enum_option
  option(std::string name,
         std::optional<special_flag> flag = std::nullopt) {
    return {ident(std::move(name)), {}, flag};
  }

  field
  make_field(std::string name, std::string type) {
    return {ident(std::move(name)), type_ref{std::move(type), {}}, {}};
  }

  std::string
  render(const std::function<void(indent_writer&)>& f) {
    std::ostringstream os;
    indent_writer w(os);
    f(w);
    return os.str();
  }

  std::size_t
  count_occurrences(const std::string& text, const std::string& needle) {
    std::size_t count = 0;
    for (auto pos = text.find(needle); pos != std::string::npos;
         pos = text.find(needle, pos + needle.size()))
      ++count;
    return count;
  }

  std::string
  read_file(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
  }

} // namespace

// ---------------------------------------------------------------------------
// Dispatch
// ---------------------------------------------------------------------------

TEST_CASE("dispatch calls one hook per declaration in order", "[generator]") {
  record_decl record;
  interface_decl iface;
  auto generic = make_decl("pair", record);
  generic.params = {{ident("first")}, {ident("second")}};

  std::vector<type_decl> idl = {make_decl("color", enum_decl{}), generic,
                                make_decl("service", iface)};

  recording_backend b;
  generate(b, idl);

  CHECK(b.calls == std::vector<std::string>{"enum:color@test.idl",
                                            "record:pair",
                                            "interface:service"});
  CHECK(b.param_counts == std::vector<std::size_t>{2, 0});
}

TEST_CASE("dispatch skips imported declarations", "[generator]") {
  std::vector<type_decl> idl = {
      make_decl("local_enum", enum_decl{}),
      make_decl("imported_record", record_decl{}, true),
      make_decl("local_record", record_decl{}),
  };

  recording_backend b;
  generate(b, idl);

  CHECK(b.calls ==
        std::vector<std::string>{"enum:local_enum@test.idl",
                                 "record:local_record"});
}

TEST_CASE("dispatch of an empty sequence calls nothing", "[generator]") {
  recording_backend b;
  generate(b, {});
  CHECK(b.calls.empty());
}

TEST_CASE("enum with type parameters is rejected", "[generator]") {
  auto decl = make_decl("bad", enum_decl{});
  decl.params = {{ident("t")}};

  recording_backend b;
  CHECK_THROWS_AS(generate(b, {decl}), generation_error);
  CHECK(b.calls.empty());
}

// ---------------------------------------------------------------------------
// Namespaces
// ---------------------------------------------------------------------------

TEST_CASE("wrap_namespace opens and closes every component",
          "[generator]") {
  auto out = render([](indent_writer& w) {
    wrap_namespace(w, "a::b::c", [](indent_writer& w) { w.wl("body"); });
  });

  CHECK(out == "namespace a { namespace b { namespace c {\n"
               "\n"
               "body\n"
               "\n"
               "} } }  // namespace a::b::c\n");
  CHECK(count_occurrences(out, "a::b::c") == 1);
}

TEST_CASE("wrap_namespace with a single component", "[generator]") {
  auto out = render([](indent_writer& w) {
    wrap_namespace(w, "app", [](indent_writer& w) { w.wl("x"); });
  });
  CHECK(out == "namespace app {\n\nx\n\n}  // namespace app\n");
}

TEST_CASE("wrap_namespace with an empty namespace adds nothing",
          "[generator]") {
  auto out = render([](indent_writer& w) {
    wrap_namespace(w, "", [](indent_writer& w) { w.wl("body"); });
  });
  CHECK(out == "body\n");
}

TEST_CASE("wrap_anonymous_namespace", "[generator]") {
  auto out = render([](indent_writer& w) {
    wrap_anonymous_namespace(w, [](indent_writer& w) { w.wl("int x;"); });
  });
  CHECK(out == "namespace { // anonymous namespace\n"
               "\n"
               "int x;\n"
               "\n"
               "} // end anonymous namespace\n");
}

// ---------------------------------------------------------------------------
// Enums
// ---------------------------------------------------------------------------

TEST_CASE("bit-flag values ignore where the special options appear",
          "[generator]") {
  enum_decl e;
  e.flags = true;
  e.options = {option("d", special_flag::no_flags), option("a"),
               option("e", special_flag::all_flags), option("b"),
               option("c")};

  auto encoded = encode_enum_options(e);

  REQUIRE(encoded.size() == 5);
  std::vector<std::string> names;
  std::vector<std::uint64_t> values;
  for (const auto& o : encoded) {
    names.push_back(o.option->ident.name());
    REQUIRE(o.value.has_value());
    values.push_back(*o.value);
  }
  CHECK(names == std::vector<std::string>{"d", "a", "b", "c", "e"});
  CHECK(values == std::vector<std::uint64_t>{0, 1, 2, 4, 7});
}

TEST_CASE("all-flags listed first still comes last", "[generator]") {
  enum_decl e;
  e.flags = true;
  e.options = {option("all", special_flag::all_flags), option("x"),
               option("y"), option("none", special_flag::no_flags)};

  auto out = render([&e](indent_writer& w) {
    auto style = ident_style::all_caps;
    write_enum_option_none(w, e, style);
    write_enum_options(w, e, style);
    write_enum_option_all(w, e, style);
  });

  CHECK(out == "NONE = 0,\nX = 1,\nY = 2,\nALL = 3,\n");
}

TEST_CASE("all-flags without ordinary options is zero", "[generator]") {
  enum_decl e;
  e.flags = true;
  e.options = {option("all", special_flag::all_flags)};

  auto encoded = encode_enum_options(e);
  REQUIRE(encoded.size() == 1);
  CHECK(encoded[0].value == std::uint64_t{0});
}

TEST_CASE("bit-flag enum uses every bit up to the last one",
          "[generator]") {
  enum_decl e;
  e.flags = true;
  for (unsigned i = 0; i < max_flag_options; ++i)
    e.options.push_back(option("o" + std::to_string(i)));
  e.options.push_back(option("all", special_flag::all_flags));

  auto encoded = encode_enum_options(e);

  REQUIRE(encoded.size() == max_flag_options + 1);
  CHECK(encoded[0].value == std::uint64_t{1});
  CHECK(encoded[max_flag_options - 1].value == (std::uint64_t{1} << 63));
  CHECK(encoded.back().value == ~std::uint64_t{0});
}

TEST_CASE("bit-flag enum with too many options is rejected",
          "[generator]") {
  enum_decl e;
  e.flags = true;
  for (unsigned i = 0; i < max_flag_options + 2; ++i)
    e.options.push_back(option("o" + std::to_string(i)));

  CHECK_THROWS_AS(encode_enum_options(e), generation_error);

  std::ostringstream os;
  indent_writer w(os);
  CHECK_THROWS_AS(write_enum_options(w, e, ident_style::identity),
                  generation_error);
}

TEST_CASE("plain enum has no option limit", "[generator]") {
  enum_decl e;
  for (unsigned i = 0; i < max_flag_options + 2; ++i)
    e.options.push_back(option("o" + std::to_string(i)));

  CHECK(encode_enum_options(e).size() == max_flag_options + 2);
}

TEST_CASE("ordinary options of a plain enum get no value", "[generator]") {
  enum_decl e;
  e.options = {option("red"), option("green")};
  e.options[1].doc.lines = {" The green one."};

  auto out = render([&e](indent_writer& w) {
    write_enum_options(w, e, ident_style::all_caps);
  });

  CHECK(out == "RED,\n/** The green one. */\nGREEN,\n");
  for (const auto& o : encode_enum_options(e))
    CHECK_FALSE(o.value.has_value());
}

// ---------------------------------------------------------------------------
// Aligned calls
// ---------------------------------------------------------------------------

TEST_CASE("aligned call continues under the opening parenthesis",
          "[generator]") {
  std::vector<field> params = {make_field("x", "i32"),
                               make_field("y", "i32"),
                               make_field("label", "string")};

  auto out = render([&params](indent_writer& w) {
    write_aligned_call(w, "Point(", params, ")",
                       [](const field& f) {
                         return f.type.name + " " + f.ident.name();
                       });
    w.wl(";");
  });

  CHECK(out == "Point(i32 x,\n"
               "      i32 y,\n"
               "      string label);\n");
}

TEST_CASE("aligned call with no parameters", "[generator]") {
  auto out = render([](indent_writer& w) {
    write_aligned_call(w, "make(", {}, ")",
                       [](const field& f) { return f.ident.name(); });
  });
  CHECK(out == "make()");
}

TEST_CASE("aligned call honors indentation and a custom delimiter",
          "[generator]") {
  std::vector<field> params = {make_field("a", "i8"), make_field("b", "i8")};

  auto out = render([&params](indent_writer& w) {
    w.nested([&] {
      write_aligned_call(w, "f(", params, " +", ")",
                         [](const field& f) { return f.ident.name(); });
      w.wl();
    });
  });

  CHECK(out == "    f(a +\n      b)\n");
}

TEST_CASE("objc aligned call lines up the colons", "[generator]") {
  std::vector<field> params = {make_field("first_name", "string"),
                               make_field("age", "i32")};

  auto out = render([&params](indent_writer& w) {
    write_aligned_objc_call(
        w, "[self initWithFirstName", params, "]",
        [](const field& f) -> std::pair<std::string, std::string> {
          return {ident_style::camel_lower(f.ident.name()),
                  ident_style::camel_lower(f.ident.name())};
        });
  });

  CHECK(out == "[self initWithFirstName:firstName\n"
               "                    age:age]");
}

// ---------------------------------------------------------------------------
// Docs
// ---------------------------------------------------------------------------

TEST_CASE("write_doc by line count", "[generator]") {
  CHECK(render([](indent_writer& w) { write_doc(w, doc{}); }).empty());

  CHECK(render([](indent_writer& w) { write_doc(w, doc{{" One line."}}); }) ==
        "/** One line. */\n");

  CHECK(render([](indent_writer& w) {
          write_doc(w, doc{{" First.", " Second."}});
        }) == "/**\n * First.\n * Second.\n */\n");
}

TEST_CASE("method doc renames whole-word parameter names", "[generator]") {
  method m;
  m.ident = ident("set_value");
  m.params = {make_field("new_value", "i32"), make_field("id", "i32")};
  m.doc.lines = {" Stores new_value under id.",
                 " new_values and identity are untouched."};

  auto out = render([&m](indent_writer& w) {
    write_method_doc(w, m, ident_style::camel_lower);
  });

  CHECK(out == "/**\n"
               " * Stores newValue under id.\n"
               " * new_values and identity are untouched.\n"
               " */\n");
}

TEST_CASE("replace_whole_word respects word boundaries", "[generator]") {
  CHECK(replace_whole_word("a b ab a_b a", "a", "X") == "X b ab a_b X");
  CHECK(replace_whole_word("(count)", "count", "n") == "(n)");
  CHECK(replace_whole_word("countcount count", "count", "n") ==
        "countcount n");
  CHECK(replace_whole_word("text", "", "n") == "text");
}

// ---------------------------------------------------------------------------
// Helpers and C++ file writers
// ---------------------------------------------------------------------------

TEST_CASE("rendering helpers", "[generator]") {
  CHECK(q("a") == "\"a\"");
  CHECK(p("a") == "(a)");
  CHECK(t("a") == "<a>");
  CHECK(pre_comma("") == "");
  CHECK(pre_comma("x") == ", x");
  CHECK(first_upper("abc") == "Abc");
  CHECK(first_upper("") == "");
  CHECK(with_ns(std::nullopt, "T") == "T");
  CHECK(with_ns(std::string(""), "T") == "::T");
  CHECK(with_ns(std::string("a::b"), "T") == "::a::b::T");
}

TEST_CASE("write_hpp_file and write_cpp_file", "[generator]") {
  auto dir = fs::temp_directory_path() / "ib_generator_files";
  fs::remove_all(dir);
  fs::create_directories(dir);

  spec s;
  s.cpp.ns = "app";
  generation_session session;
  generator gen(s, session);

  CHECK(gen.with_cpp_ns("Foo") == "::app::Foo");

  gen.write_hpp_file(
      dir, s.cpp.ns, ident_style::identity, "my_record", "my.idl",
      {"#include <string>"}, {"class Other;"},
      [](indent_writer& w) { w.wl("struct MyRecord {};"); },
      [](indent_writer&) {});

  CHECK(read_file(dir / "my_record.hpp") ==
        "// AUTOGENERATED FILE - DO NOT MODIFY!\n"
        "// This file was generated by ib from my.idl\n"
        "\n"
        "#pragma once\n"
        "\n"
        "#include <string>\n"
        "\n"
        "namespace app {\n"
        "\n"
        "class Other;\n"
        "\n"
        "struct MyRecord {};\n"
        "\n"
        "}  // namespace app\n");

  gen.write_cpp_file(dir, s.cpp.ns, ident_style::identity, "gen/",
                     "my_record", "my.idl",
                     {"#include \"gen/my_record.hpp\"", "#include <utility>"},
                     [](indent_writer& w) { w.wl("int x = 0;"); });

  CHECK(read_file(dir / "my_record.cpp") ==
        "// AUTOGENERATED FILE - DO NOT MODIFY!\n"
        "// This file was generated by ib from my.idl\n"
        "\n"
        "#include \"gen/my_record.hpp\"  // my header\n"
        "#include <utility>\n"
        "\n"
        "namespace app {\n"
        "\n"
        "int x = 0;\n"
        "\n"
        "}  // namespace app\n");

  fs::remove_all(dir);
}
