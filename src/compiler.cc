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

#include "qsema/compiler.h"

#include <fmt/core.h>

#include <cstddef>
#include <future>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "qsema/checker.h"
#include "qsema/linearity.h"

namespace qsema {

bool CheckedProgram::ok() const {
  for (const auto& d : diagnostics) {
    if (d.severity == Severity::Error) return false;
  }
  return true;
}

const TFunction* CheckedProgram::find(std::string_view qualified_name) const {
  for (const auto& f : functions) {
    if (f->qualified_name() == qualified_name) return f.get();
  }
  return nullptr;
}

namespace {

struct DefinitionResult {
  std::vector<std::shared_ptr<const TFunction>> functions;
  typing::StructDeclPtr decl;
  std::vector<Diagnostic> diagnostics;
  bool rejected = false;
};

std::string definition_name(const Def& def) {
  if (const auto* f = dynamic_cast<const FunctionDef*>(&def)) return f->name;
  if (const auto* s = dynamic_cast<const StructDef*>(&def)) {
    return s->decl->name();
  }
  return {};
}

/**
 * Registers the signatures a definition declares.
 *
 * Every user definition introduces new names. A definition is validated
 * in full before anything is added, so a rejected definition leaves the
 * table unchanged.
 */
class HeaderRegistrar : public Def::Visitor {
 public:
  explicit HeaderRegistrar(SignatureTable& table) : table_(table) {}

  void visitFunctionDef(const FunctionDef& def) override {
    auto signature = function_signature(def);
    check_new(signature.name, def.location);
    table_.add(std::move(signature));
  }

  void visitStructDef(const StructDef& def) override {
    check_new(def.decl->name(), def.location);
    std::vector<Signature> methods;
    std::set<std::string> names;
    for (const auto& m : def.methods) {
      auto signature = method_signature(def, *m);
      if (!names.insert(signature.name).second) {
        throw SemanticError(
            ErrorKind::DuplicateDefinitionError,
            fmt::format("Method {} is defined twice", signature.name),
            m->location, {signature.name});
      }
      check_new(signature.name, m->location);
      methods.push_back(std::move(signature));
    }
    table_.add_struct(def.decl, def.location);
    for (auto& m : methods) table_.add(std::move(m));
  }

 private:
  SignatureTable& table_;

  void check_new(const std::string& name, const Location& location) const {
    if (table_.find(name) || table_.find_struct(name)) {
      throw SemanticError(ErrorKind::DuplicateDefinitionError,
                          fmt::format("{} is already defined", name), location,
                          {name});
    }
  }
};

class DefinitionChecker : public Def::Visitor {
 public:
  DefinitionChecker(const SignatureTable& table, const CheckOptions& options,
                    DefinitionResult& result)
      : checker_(table), options_(options), result_(result) {}

  void visitFunctionDef(const FunctionDef& def) override {
    auto fn = checker_.check_function(def);
    analyse(*fn);
    result_.functions.push_back(std::move(fn));
  }

  void visitStructDef(const StructDef& def) override {
    for (auto& m : checker_.check_struct(def)) {
      analyse(*m);
      result_.functions.push_back(std::move(m));
    }
    result_.decl = def.decl;
  }

 private:
  Checker checker_;
  LinearityChecker linearity_;
  const CheckOptions& options_;
  DefinitionResult& result_;

  void analyse(const TFunction& fn) {
    if (!options_.run_linearity) return;
    for (auto& w : linearity_.check(fn)) {
      result_.diagnostics.push_back(std::move(w));
    }
  }
};

DefinitionResult check_definition(const Def& def, const SignatureTable& table,
                                  const CheckOptions& options) {
  DefinitionResult result;
  try {
    DefinitionChecker checker{table, options, result};
    def.accept(checker);
  } catch (SemanticError& e) {
    result.functions.clear();
    result.decl = nullptr;
    result.diagnostics.push_back(e.to_diagnostic(definition_name(def)));
    result.rejected = true;
  }
  return result;
}

}  // namespace

Compiler::Compiler(Reporter& reporter, CheckOptions options)
    : reporter_(reporter), options_(options) {}

CheckedProgram Compiler::check(const std::vector<std::unique_ptr<Def>>& defs) {
  auto table = std::make_shared<SignatureTable>();
  install_prelude(*table);
  std::vector<DefinitionResult> results(defs.size());
  for (std::size_t i = 0; i < defs.size(); ++i) {
    try {
      HeaderRegistrar registrar{*table};
      defs[i]->accept(registrar);
    } catch (SemanticError& e) {
      results[i].diagnostics.push_back(
          e.to_diagnostic(definition_name(*defs[i])));
      results[i].rejected = true;
    }
  }
  table->finalize();

  if (options_.parallel) {
    std::vector<std::future<DefinitionResult>> pending(defs.size());
    for (std::size_t i = 0; i < defs.size(); ++i) {
      if (results[i].rejected) continue;
      pending[i] = std::async(std::launch::async, [this, &defs, &table, i] {
        return check_definition(*defs[i], *table, options_);
      });
    }
    for (std::size_t i = 0; i < defs.size(); ++i) {
      if (pending[i].valid()) results[i] = pending[i].get();
    }
  } else {
    for (std::size_t i = 0; i < defs.size(); ++i) {
      if (results[i].rejected) continue;
      results[i] = check_definition(*defs[i], *table, options_);
    }
  }

  CheckedProgram program;
  program.table = table;
  std::size_t rejected = 0;
  for (auto& r : results) {
    for (auto& d : r.diagnostics) {
      if (d.severity == Severity::Error) {
        reporter_.report_error(d);
      } else {
        reporter_.report_warning(d);
      }
      program.diagnostics.push_back(std::move(d));
    }
    if (r.rejected) {
      ++rejected;
      continue;
    }
    for (auto& f : r.functions) program.functions.push_back(std::move(f));
    if (r.decl) program.structs.push_back(std::move(r.decl));
  }
  reporter_.report_info(fmt::format("Checked {} definitions, {} rejected\n",
                                    defs.size(), rejected));
  return program;
}

}  // namespace qsema
