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

#include "private/ast_printer.h"

#include <fmt/core.h>

#include <cstdint>
#include <iterator>
#include <string>
#include <string_view>

#include "qsema/ast.h"

namespace qsema::astprinter {

void print_ast(std::string& out, int, std::string_view arg) {
  out.append(arg);
}

void print_ast(std::string& out, int, const char* arg) { out.append(arg); }

void print_ast(std::string& out, int, bool arg) {
  out.append(arg ? "true" : "false");
}

void print_ast(std::string& out, int, int64_t arg) {
  out.append(std::to_string(arg));
  out += 'i';
}

void print_ast(std::string& out, int, double arg) {
  out.append(fmt::format("{}", arg));
}

void print_ast(std::string& out, int, const std::string& arg) {
  out += '"';
  out.append(arg);
  out += '"';
}

void print_ast(std::string& out, int, const typing::TypePtr& arg) {
  if (!arg) {
    out.append("null");
    return;
  }
  out += '<';
  out.append(typing::print_type(arg));
  out += '>';
}

void print_ast(std::string& out, int, const typing::GenericParams& arg) {
  out += '[';
  bool first = true;
  for (const auto& p : arg.types) {
    if (first)
      first = false;
    else
      out.append(", ");
    out.append(p.name);
    if (!p.copyable) out.append(p.droppable ? " @affine" : " @linear");
  }
  for (const auto& n : arg.nats) {
    if (first)
      first = false;
    else
      out.append(", ");
    out.append("nat ");
    out.append(n);
  }
  out += ']';
}

void print_ast(std::string& out, int, const typing::Param& arg) {
  fmt::format_to(std::back_inserter(out), "({} <{}> {})", arg.name,
                 typing::print_type(arg.type), arg.ownership);
}

void print_ast(std::string& out, int, const typing::StructDeclPtr& arg) {
  fmt::format_to(std::back_inserter(out), "(struct {}", arg->name());
  for (const auto& f : arg->fields()) {
    fmt::format_to(std::back_inserter(out), " ({} <{}>)", f.name,
                   typing::print_type(f.type));
  }
  out += ')';
}

}  // namespace qsema::astprinter
