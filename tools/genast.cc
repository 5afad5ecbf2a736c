// Copyright 2023 Matt Rudary

// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at

//     http://www.apache.org/licenses/LICENSE-2.0

// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

/**
 * @file genast.cc
 *
 * Generates classes for the qsema syntax tree.
 *
 * The tree is the input to semantic analysis. Names are plain strings
 * and type annotations arrive already resolved to typing::TypePtr.
 */

#include <fmt/core.h>
#include <fmt/format.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <map>
#include <regex>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace qsema::tools {

namespace {

/**
 * A node class, described by its fields.
 *
 * Each field is written "TYPE NAME" or "TYPE NAME=DEFAULT", where TYPE
 * may use the shorthands
 *
 *     str     -> std::string
 *     [ELEM]  -> std::vector<ELEM>
 *     CLASS*  -> std::unique_ptr<CLASS>
 *
 * A NAME spelled =NAME is copied into the node; every other field is
 * moved in from its constructor argument.
 */
struct NodeSpec {
  std::string name;
  std::vector<std::string> fields;
};

struct Category {
  std::string name;
  std::vector<NodeSpec> nodes;
};

const std::vector<Category> CATEGORIES{
    {"Expr",
     {
         {"IntLiteral", {"int64_t =value"}},
         {"FloatLiteral", {"double =value"}},
         {"BoolLiteral", {"bool =value"}},
         {"Name", {"str name"}},
         {"Tuple", {"[Expr*] elements"}},
         {"Array", {"[Expr*] elements"}},
         {"Call", {"str callee", "[Expr*] args"}},
         {"MethodCall", {"Expr* receiver", "str method", "[Expr*] args"}},
         {"Field", {"Expr* object", "str field"}},
         {"Subscript", {"Expr* array", "Expr* index"}},
         {"BinaryOp", {"str op", "Expr* left", "Expr* right"}},
         {"UnaryOp", {"str op", "Expr* operand"}},
         {"Annotated", {"Expr* expr", "typing::TypePtr type"}},
     }},
    {"Stmt",
     {
         {"Assign",
          {"str target", "Expr* value", "typing::TypePtr annotation=nullptr"}},
         {"TupleAssign", {"[str] targets", "Expr* value"}},
         {"Expr", {"Expr* expr"}},
         {"Return", {"Expr* value=nullptr"}},
         {"If", {"Expr* condition", "[Stmt*] then_body", "[Stmt*] else_body"}},
         {"While", {"Expr* condition", "[Stmt*] body"}},
         {"For", {"str variable", "Expr* iterable", "[Stmt*] body"}},
         {"Break", {}},
         {"Continue", {}},
     }},
    {"Def",
     {
         {"Function",
          {"str name", "typing::GenericParams generics",
           "[typing::Param] params", "typing::TypePtr return_type",
           "[Stmt*] body"}},
         {"Struct", {"typing::StructDeclPtr decl", "[FunctionDef*] methods"}},
     }},
};

const std::string COPYRIGHT = R"(// Copyright 2023 Matt Rudary

// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at

//     http://www.apache.org/licenses/LICENSE-2.0

// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.
)";

const std::string HEADER_TEMPLATE = R"(%COPYRIGHT%
/* This file is generated. Do not hand-edit! */

#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "qsema/location.h"
#include "qsema/types.h"

namespace qsema {
%DECLS%
}  // namespace qsema
)";

const std::string SOURCE_TEMPLATE = R"(%COPYRIGHT%
/* This file is generated. Do not hand-edit! */

#include "qsema/ast.h"

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "private/ast_printer.h"

namespace qsema {
%IMPLS%
}  // namespace qsema
)";

const std::string CATEGORY_DECL_TEMPLATE = R"(
%FORWARD%

/** Base class of the %BASE% nodes. */
class %BASE% {
 public:
  class Visitor {
   public:
    virtual ~Visitor();
%VISITS%
  };

  Location location;

  explicit %BASE%(const Location& location);
  virtual ~%BASE%();

  virtual void accept(Visitor& visitor) const = 0;
};
%NODES%
/** Prints `v` as an s-expression, nested lines indented past `indent`. */
std::string print_ast(const %BASE%& v, int indent = 0);
void print_ast(const %BASE%& v, std::string& out, int indent = 0);
)";

const std::string CATEGORY_IMPL_TEMPLATE = R"(
%BASE%::%BASE%(const Location& location) : location(location) {}
%BASE%::~%BASE%() = default;
%BASE%::Visitor::~Visitor() = default;
%NODES%
namespace {

class %BASE%Printer : public %BASE%::Visitor {
 public:
  %BASE%Printer(std::string& out, int indent) : out_(out), indent_(indent) {}
%PRINTS%
 private:
  std::string& out_;
  int indent_;
};

}  // namespace

std::string print_ast(const %BASE%& v, int indent) {
  std::string out;
  print_ast(v, out, indent);
  return out;
}

void print_ast(const %BASE%& v, std::string& out, int indent) {
  %BASE%Printer printer(out, indent);
  v.accept(printer);
}
)";

const std::string NODE_DECL_TEMPLATE = R"(
class %NAME% : public %BASE% {
 public:
  %EXPLICIT%%NAME%(%PARAMS_WITH_DEFAULTS%);
  ~%NAME%() override;

  void accept(Visitor& visitor) const override;
%FIELDS%};
)";

const std::string NODE_IMPL_TEMPLATE = R"(
%NAME%::%NAME%(%PARAMS%)
    : %BASE%(location)%INITS% {}

%NAME%::~%NAME%() = default;

void %NAME%::accept(Visitor& visitor) const { visitor.visit%NAME%(*this); }
)";

const std::string PRINT_TEMPLATE = R"(
  void visit%NAME%(const %NAME%& node) override {
    astprinter::print_sexp(out_, indent_, %SEXP%);
  }
)";

struct Field {
  std::string type;
  std::string name;
  bool copied = false;
  std::string default_value;
};

const std::regex STR_RE(R"(\bstr\b)");
const std::regex VEC_RE(R"(\[(.*)\])");
const std::regex PTR_RE(R"((\w*)\*)");

std::string expand_type(std::string t) {
  t = std::regex_replace(t, STR_RE, "std::string");
  t = std::regex_replace(t, VEC_RE, "std::vector<$1>");
  return std::regex_replace(t, PTR_RE, "std::unique_ptr<$1>");
}

Field parse_field(std::string_view text) {
  const auto space = text.find(' ');
  if (space == std::string_view::npos || space + 1 == text.size())
    throw std::runtime_error(
        fmt::format("Field should be \"TYPE NAME\" but was {}", text));
  Field field;
  field.type = expand_type(std::string(text.substr(0, space)));
  auto rest = text.substr(space + 1);
  if (rest.front() == '=') {
    field.copied = true;
    rest.remove_prefix(1);
  }
  if (const auto equals = rest.find('='); equals != std::string_view::npos) {
    field.default_value = rest.substr(equals + 1);
    rest = rest.substr(0, equals);
  }
  field.name = rest;
  return field;
}

using Dict = std::map<std::string, std::string, std::less<>>;

std::string fill(std::string_view templ, const Dict& dict) {
  std::string out;
  std::size_t pos = 0;
  while (true) {
    const auto start = templ.find('%', pos);
    out.append(templ.substr(pos, start - pos));
    if (start == std::string_view::npos) return out;
    const auto stop = templ.find('%', start + 1);
    if (stop == std::string_view::npos)
      throw std::runtime_error("Template ends mid-substitution.");
    const auto var = templ.substr(start + 1, stop - start - 1);
    const auto sub = dict.find(var);
    if (sub == dict.end())
      throw std::runtime_error(fmt::format("No substitution for {}", var));
    out.append(sub->second);
    pos = stop + 1;
  }
}

Dict node_dict(const std::string& base, const NodeSpec& node) {
  std::vector<Field> fields;
  for (const auto& f : node.fields) fields.push_back(parse_field(f));

  std::vector<std::string> params{"const Location& location"};
  std::vector<std::string> params_with_defaults{"const Location& location"};
  std::vector<std::string> members;
  std::vector<std::string> inits;
  const std::string name = node.name + base;
  std::vector<std::string> sexp{fmt::format("\"{}\"", name)};
  for (const auto& f : fields) {
    params.push_back(fmt::format("{} {}", f.type, f.name));
    params_with_defaults.push_back(
        f.default_value.empty()
            ? params.back()
            : fmt::format("{} {} = {}", f.type, f.name, f.default_value));
    members.push_back(fmt::format("  {} {};\n", f.type, f.name));
    inits.push_back(f.copied ? fmt::format("{0}({0})", f.name)
                             : fmt::format("{0}(std::move({0}))", f.name));
    sexp.push_back(fmt::format("\":{}\"", f.name));
    sexp.push_back(fmt::format("node.{}", f.name));
  }

  Dict dict;
  dict["BASE"] = base;
  dict["NAME"] = name;
  dict["EXPLICIT"] = fields.empty() ? "explicit " : "";
  dict["PARAMS"] = fmt::format("{}", fmt::join(params, ",\n    "));
  dict["PARAMS_WITH_DEFAULTS"] =
      fmt::format("{}", fmt::join(params_with_defaults, ",\n    "));
  dict["FIELDS"] =
      fields.empty() ? "" : fmt::format("\n{}", fmt::join(members, ""));
  dict["INITS"] = fields.empty() ? ""
                                 : fmt::format(",\n      {}",
                                               fmt::join(inits, ",\n      "));
  dict["SEXP"] = fmt::format("{}", fmt::join(sexp, ",\n        "));
  return dict;
}

void generate_category(const Category& cat, std::string& decls,
                       std::string& impls) {
  Dict dict;
  dict["BASE"] = cat.name;
  for (const auto& node : cat.nodes) {
    const Dict nd = node_dict(cat.name, node);
    dict["FORWARD"] += fill("\nclass %NAME%;", nd);
    dict["VISITS"] +=
        fill("    virtual void visit%NAME%(const %NAME%& node) = 0;\n", nd);
    dict["NODES"] += fill(NODE_DECL_TEMPLATE, nd);
    dict["NODE_IMPLS"] += fill(NODE_IMPL_TEMPLATE, nd);
    dict["PRINTS"] += fill(PRINT_TEMPLATE, nd);
  }
  decls += fill(CATEGORY_DECL_TEMPLATE, dict);
  dict["NODES"] = dict["NODE_IMPLS"];
  impls += fill(CATEGORY_IMPL_TEMPLATE, dict);
}

void write_file(const std::filesystem::path& path, const std::string& text) {
  std::filesystem::create_directories(path.parent_path());
  std::ofstream file(path);
  file << text;
  if (!file)
    throw std::runtime_error(fmt::format("Could not write {}", path.string()));
}

void generate_code(const char* header_filename, const char* cc_filename) {
  Dict dict;
  dict["COPYRIGHT"] = COPYRIGHT;
  for (const auto& cat : CATEGORIES)
    generate_category(cat, dict["DECLS"], dict["IMPLS"]);
  write_file(header_filename, fill(HEADER_TEMPLATE, dict));
  write_file(cc_filename, fill(SOURCE_TEMPLATE, dict));
}

}  // namespace

}  // namespace qsema::tools

int main(int argc, const char** argv) {
  if (argc != 3) {
    std::cerr << "Usage: " << argv[0] << " HEADER CC\n";
    std::exit(1);
  }
  try {
    qsema::tools::generate_code(argv[1], argv[2]);
  } catch (const std::exception& e) {
    std::cerr << argv[0] << ": " << e.what() << "\n";
    std::exit(1);
  }
}
