/***
 * Name: gsc::lex::FileInput / gsc::lex::StringInput
 * Purpose: Line readers backing the lexer's input stack.
 */
#include "lexer/FileInput.h"
#include "lexer/StringInput.h"
#include "gsc/exceptions/file_read_error.h"

#include <fstream>
#include <memory>
#include <sstream>
#include <string>
#include <utility>

namespace gsc::lex {

FileInput::FileInput(std::string path) : path_(std::move(path)), in_(nullptr) {
  auto ifs = std::make_unique<std::ifstream>(path_);
  if (!ifs->is_open()) { throw exceptions::FileReadError("cannot open file: " + path_); }
  in_ = std::move(ifs);
}

bool FileInput::getline(std::string& out) {
  if (!in_ || !(*in_)) { return false; }
  return static_cast<bool>(std::getline(*in_, out));
}

StringInput::StringInput(std::string text, std::string name)
  : name_(std::move(name)), in_(std::make_unique<std::istringstream>(std::move(text))) {}

bool StringInput::getline(std::string& out) {
  if (!in_ || !(*in_)) { return false; }
  return static_cast<bool>(std::getline(*in_, out));
}

} // namespace gsc::lex
