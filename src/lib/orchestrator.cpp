#include <ib/orchestrator.hpp>
#include <ib/generation_error.hpp>
#include <ib/swift_bridging_header.hpp>

#include <fstream>
#include <iostream>
#include <utility>

namespace ib {

  namespace {

    // `out` enables the backend; its header folder defaults to it.
    std::vector<output_folder>
    source_and_header(const std::optional<fs::path>& out,
                      const std::optional<fs::path>& header_out,
                      std::string label, std::string header_label) {
      if (!out) return {};
      return {{std::move(label), *out},
              {std::move(header_label), header_out.value_or(*out)}};
    }

    std::vector<output_folder>
    source_and_optional_header(const std::optional<fs::path>& out,
                               const std::optional<fs::path>& header_out,
                               std::string label, std::string header_label) {
      if (!out) return {};
      std::vector<output_folder> folders{{std::move(label), *out}};
      if (header_out) folders.push_back({std::move(header_label), *header_out});
      return folders;
    }

    std::vector<output_folder>
    single(const std::optional<fs::path>& out, std::string label) {
      if (!out) return {};
      return {{std::move(label), *out}};
    }

  } // namespace

  std::string_view
  to_string(backend_id id) {
    switch (id) {
    case backend_id::cpp: return "C++";
    case backend_id::java: return "Java";
    case backend_id::jni: return "JNI";
    case backend_id::objc: return "Objective-C";
    case backend_id::objcpp: return "Objective-C++";
    case backend_id::swift_bridging_header: return "Swift bridging header";
    case backend_id::cpp_cli: return "C++/CLI";
    case backend_id::yaml: return "YAML";
    case backend_id::python: return "Python";
    case backend_id::c_wrapper: return "C wrapper";
    case backend_id::pycffi: return "Cffi";
    }
    return "";
  }

  void
  backend_registry::add(backend_id id, backend_runner runner) {
    runners_.insert_or_assign(id, std::move(runner));
  }

  const backend_runner*
  backend_registry::find(backend_id id) const {
    auto it = runners_.find(id);
    if (it == runners_.end()) return nullptr;
    return &it->second;
  }

  backend_registry
  default_backends() {
    backend_registry registry;
    registry.add(backend_id::swift_bridging_header,
                 [](const std::vector<type_decl>& idl, const spec& s,
                    generation_session& session) {
                   swift_bridging_header header{generator{s, session}};
                   header.begin();
                   generate(header, idl);
                 });
    return registry;
  }

  std::vector<backend_step>
  backend_steps(const spec& s) {
    std::vector<backend_step> steps;

    auto add = [&steps](backend_id id, bool enabled,
                        std::vector<output_folder> folders) {
      steps.push_back({id, enabled, std::move(folders)});
    };

    add(backend_id::cpp, s.cpp.out.has_value(),
        source_and_header(s.cpp.out, s.cpp.header_out, "C++", "C++ header"));
    add(backend_id::java, s.java.out.has_value(), single(s.java.out, "Java"));
    add(backend_id::jni, s.jni.out.has_value(),
        source_and_header(s.jni.out, s.jni.header_out, "JNI C++",
                          "JNI C++ header"));
    add(backend_id::objc, s.objc.out.has_value(),
        source_and_optional_header(s.objc.out, s.objc.header_out,
                                   "Objective-C", "Objective-C header"));
    add(backend_id::objcpp, s.objcpp.out.has_value(),
        source_and_optional_header(s.objcpp.out, s.objcpp.header_out,
                                   "Objective-C++", "Objective-C++ header"));

    // Writes into the Objective-C header folder created by the step above.
    add(backend_id::swift_bridging_header,
        s.objc.out.has_value() &&
            s.objc.swift_bridging_header_name.has_value(),
        {});

    add(backend_id::cpp_cli, s.cpp_cli.out.has_value(),
        single(s.cpp_cli.out, "C++/CLI"));
    add(backend_id::yaml, s.yaml.out.has_value(), single(s.yaml.out, "YAML"));
    add(backend_id::python, s.python.out.has_value(),
        single(s.python.out, "Python"));
    add(backend_id::c_wrapper, s.c_wrapper.out.has_value(),
        source_and_header(s.c_wrapper.out, s.c_wrapper.header_out, "C",
                          "C header"));
    add(backend_id::pycffi, s.pycffi.out.has_value(),
        single(s.pycffi.out, "Cffi"));

    return steps;
  }

  std::optional<std::string>
  generate(const std::vector<type_decl>& idl, const spec& s,
           generation_session& session, const backend_registry& backends) {
    try {
      for (const auto& step : backend_steps(s)) {
        if (!step.enabled) continue;

        const auto* runner = backends.find(step.id);
        if (runner == nullptr)
          throw generation_error("No generator is registered for " +
                                 std::string(to_string(step.id)) +
                                 " output.");

        if (!s.skip_generation) {
          for (const auto& folder : step.folders)
            create_folder(folder.label, folder.path);
        }

        (*runner)(idl, s, session);
      }
    } catch (const generation_error& e) {
      return e.what();
    }
    return std::nullopt;
  }

  std::optional<std::string>
  generate(const std::vector<type_decl>& idl, const spec& s,
           generation_session& session) {
    return generate(idl, s, session, default_backends());
  }

  std::optional<std::string>
  generate(const std::vector<type_decl>& idl, const spec& s,
           const backend_registry& backends) {
    if (!s.out_file_list) {
      generation_session session;
      return generate(idl, s, session, backends);
    }

    if (*s.out_file_list == "-") {
      generation_session session(true, &std::cout);
      return generate(idl, s, session, backends);
    }

    std::ofstream list(*s.out_file_list, std::ios::binary);
    if (!list)
      return "Unable to open \"" + s.out_file_list->string() +
             "\" for writing.";
    generation_session session(true, &list);
    return generate(idl, s, session, backends);
  }

  std::optional<std::string>
  generate(const std::vector<type_decl>& idl, const spec& s) {
    return generate(idl, s, default_backends());
  }

} // namespace ib
