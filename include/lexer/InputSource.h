/**
 * Name: gsc::lex::InputSource
 * Purpose: Abstract line-oriented script source.
 */
#pragma once

#include <string>

namespace gsc::lex {

class InputSource {
public:
    virtual ~InputSource() = default;

    virtual bool getline(std::string& out) = 0; // false on EOF
    virtual const std::string& name() const = 0;
};

} // namespace gsc::lex
