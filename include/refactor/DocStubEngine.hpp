#pragma once
#include <optional>
#include <string>

namespace mcc {

// Produces placeholder docstrings for declarations that have none.
class DocStubEngine {
public:
  virtual ~DocStubEngine() = default;

  // Docstring lines (with trailing newline) for a `fn`/`def` header,
  // indented by `indent` spaces.
  virtual std::optional<std::string>
  docForSignature(const std::string& signature, unsigned indent) = 0;

  // One-line docstring for a struct declaration.
  virtual std::optional<std::string>
  docForStruct(const std::string& name, unsigned indent) = 0;
};

// Factory for the signature-driven heuristic engine
DocStubEngine* makeHeuristicDocStubs();

} // namespace mcc
