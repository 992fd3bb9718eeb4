/**
 * Name: gsc::lex::FileInput
 * Purpose: Script source read from a file on disk.
 * Theory of Operation:
 *   Opens the file eagerly; a missing or unreadable file raises
 *   exceptions::FileReadError so the driver can report it before lexing.
 */
#pragma once

#include <istream>
#include <memory>
#include <string>
#include "lexer/InputSource.h"

namespace gsc::lex {

class FileInput : public InputSource {
public:
    explicit FileInput(std::string path);

    bool getline(std::string& out) override;

    const std::string& name() const override { return path_; }

private:
    std::string path_{};
    std::unique_ptr<std::istream> in_{nullptr};
};

} // namespace gsc::lex
