#pragma once
#include <memory>
#include <string>
#include <vector>

namespace mcc {

// Decides whether a rewritten file is still acceptable.
class Validator {
public:
  virtual ~Validator() = default;
  virtual bool validate(const std::string& path, std::string* error) = 0;
};

// Brackets balance outside strings and comments, no string is left open.
bool checkStructure(const std::string& text, std::string* error);

std::unique_ptr<Validator> makeStructuralValidator();

// Runs `program args...`; "{file}" in args is replaced by the path and
// "{out}" by a scratch output path. Exit code 0 passes.
std::unique_ptr<Validator> makeCommandValidator(std::string program, std::vector<std::string> args);

// Structural check, then `mojo build {file} -o {out}` when mojo is on PATH.
std::unique_ptr<Validator> makeDefaultValidator();

} // namespace mcc
