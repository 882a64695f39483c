#pragma once

#include <oag/cpp_code.hpp>
#include <oag/declaration_synthesizer.hpp>
#include <oag/type_map.hpp>

#include <string>
#include <vector>

namespace oag {

  enum class output_mode { header_only, file_per_type };

  struct codegen_options {
    // C++ namespace of the generated declarations; empty for the global
    // namespace. Nested names ("acme::api") are allowed.
    std::string cpp_namespace = "api";
    output_mode mode = output_mode::header_only;
    // Base name of the generated header(s)
    std::string file_stem = "schemas";
    bool doc_comments = true;
    bool file_header = true;
  };

  class codegen {
    const synthesis_result& result_;
    const type_map& types_;
    codegen_options options_;

  public:
    codegen(const synthesis_result& result, const type_map& types,
            codegen_options options = {});

    // The result and type map are held by reference
    codegen(synthesis_result&&, const type_map&, codegen_options = {}) = delete;
    codegen(const synthesis_result&, type_map&&, codegen_options = {}) = delete;
    codegen(synthesis_result&&, type_map&&, codegen_options = {}) = delete;

    std::vector<cpp_file>
    generate() const;
  };

} // namespace oag
