#include "refactor/Validator.hpp"
#include "analyzers/ComplianceChecker.hpp"
#include "source/SourceFile.hpp"
#include "source/Tokenizer.hpp"

#include "llvm/ADT/SmallString.h"
#include "llvm/Support/FileSystem.h"
#include "llvm/Support/Program.h"
#include "llvm/Support/WithColor.h"
#include "llvm/Support/raw_ostream.h"

namespace mcc {

bool checkStructure(const std::string& text, std::string* error) {
  auto fail = [&](size_t line, const std::string& what) {
    if (error) *error = what + " on line " + std::to_string(line + 1);
    return false;
  };

  std::vector<std::pair<char, size_t>> open;
  bool inTriple = false;
  size_t tripleLine = 0;
  auto lines = splitLines(text);
  for (size_t i = 0; i < lines.size(); ++i) {
    llvm::StringRef line(lines[i]);
    if (inTriple) {
      size_t close = line.find("\"\"\"");
      if (close == llvm::StringRef::npos) continue;
      line = line.substr(close + 3);
      inTriple = false;
    }
    for (const auto& t : tokenizeLine(line)) {
      if (t.kind == TokenKind::String && t.unterminated) {
        if (!llvm::StringRef(t.text).ltrim("rRbBfF").startswith("\"\"\""))
          return fail(i, "unterminated string");
        inTriple = true;
        tripleLine = i;
        break;
      }
      if (t.kind != TokenKind::Punct || t.text.size() != 1) continue;
      char c = t.text[0];
      if (c == '(' || c == '[' || c == '{') {
        open.emplace_back(c, i);
      } else if (c == ')' || c == ']' || c == '}') {
        char want = c == ')' ? '(' : c == ']' ? '[' : '{';
        if (open.empty() || open.back().first != want)
          return fail(i, std::string("unbalanced '") + c + "'");
        open.pop_back();
      }
    }
  }
  if (inTriple) return fail(tripleLine, "unterminated docstring");
  if (!open.empty())
    return fail(open.back().second, std::string("unclosed '") + open.back().first + "'");
  return true;
}

namespace {

class StructuralValidator final : public Validator {
public:
  bool validate(const std::string& path, std::string* error) override {
    std::string text;
    if (!readSourceFile(path, text, error)) return false;
    return checkStructure(text, error);
  }
};

class CommandValidator final : public Validator {
  std::string program_;
  std::vector<std::string> args_;

public:
  CommandValidator(std::string program, std::vector<std::string> args)
    : program_(std::move(program)), args_(std::move(args)) {}

  bool validate(const std::string& path, std::string* error) override {
    auto prog = llvm::sys::findProgramByName(program_);
    if (!prog) {
      if (error) *error = program_ + " not found: " + prog.getError().message();
      return false;
    }

    llvm::SmallString<128> scratch;
    if (auto ec = llvm::sys::fs::createTemporaryFile("mcc-validate", "out", scratch)) {
      if (error) *error = "cannot create scratch file: " + ec.message();
      return false;
    }

    std::vector<std::string> storage{*prog};
    for (const auto& a : args_) {
      if (a == "{file}") storage.push_back(path);
      else if (a == "{out}") storage.push_back(scratch.str().str());
      else storage.push_back(a);
    }
    std::vector<llvm::StringRef> argv(storage.begin(), storage.end());

    std::string errMsg;
    int rc = llvm::sys::ExecuteAndWait(*prog, argv, /*Env=*/{}, /*Redirects=*/{}, 0, 0, &errMsg);
    if (auto ec = llvm::sys::fs::remove(scratch))
      llvm::WithColor::warning() << "cannot remove " << scratch << ": " << ec.message() << "\n";
    if (rc != 0) {
      if (error) *error = errMsg.empty() ? program_ + " exited with code " + std::to_string(rc)
                                         : errMsg;
      return false;
    }
    return true;
  }
};

class DefaultValidator final : public Validator {
  StructuralValidator structural_;

public:
  bool validate(const std::string& path, std::string* error) override {
    if (!structural_.validate(path, error)) return false;
    if (!llvm::sys::findProgramByName("mojo")) {
      llvm::WithColor::warning() << "mojo not found on PATH; only structural validation ran for "
                                 << path << "\n";
      return true;
    }
    CommandValidator build("mojo", {"build", "{file}", "-o", "{out}"});
    return build.validate(path, error);
  }
};

} // namespace

std::unique_ptr<Validator> makeStructuralValidator() {
  return std::make_unique<StructuralValidator>();
}

std::unique_ptr<Validator> makeCommandValidator(std::string program, std::vector<std::string> args) {
  return std::make_unique<CommandValidator>(std::move(program), std::move(args));
}

std::unique_ptr<Validator> makeDefaultValidator() {
  return std::make_unique<DefaultValidator>();
}

} // namespace mcc
