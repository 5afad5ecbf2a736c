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

#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "qsema/types.h"

/**
 * Helpers for the generated `print_ast` functions.
 *
 * A node prints as `(NodeName` followed by one line per field label and
 * field value, each indented four columns past the node.
 */
namespace qsema::astprinter {

void print_ast(std::string& out, int indent, std::string_view arg);
void print_ast(std::string& out, int indent, const char* arg);
void print_ast(std::string& out, int indent, bool arg);
void print_ast(std::string& out, int indent, int64_t arg);
void print_ast(std::string& out, int indent, double arg);
void print_ast(std::string& out, int indent, const std::string& arg);
void print_ast(std::string& out, int indent, const typing::TypePtr& arg);
void print_ast(std::string& out, int indent,
               const typing::GenericParams& arg);
void print_ast(std::string& out, int indent, const typing::Param& arg);
void print_ast(std::string& out, int indent,
               const typing::StructDeclPtr& arg);

inline void newline(std::string& out, int indent) {
  out += '\n';
  out.append(indent, ' ');
}

template <typename T>
void print_ast(std::string& out, int indent, const std::unique_ptr<T>& arg) {
  if (arg)
    print_ast(*arg, out, indent);
  else
    out.append("null");
}

/** Empty and singleton lists stay on one line. */
template <typename T>
void print_ast(std::string& out, int indent, const std::vector<T>& arg) {
  out += '(';
  if (arg.size() == 1) {
    print_ast(out, indent, arg.front());
  } else if (!arg.empty()) {
    for (const auto& a : arg) {
      newline(out, indent + 4);
      print_ast(out, indent + 4, a);
    }
    newline(out, indent);
  }
  out += ')';
}

template <typename... Args>
void print_sexp(std::string& out, int indent, const char* head,
                const Args&... args) {
  out += '(';
  out.append(head);
  ((newline(out, indent + 4), print_ast(out, indent + 4, args)), ...);
  out += ')';
}

}  // namespace qsema::astprinter
