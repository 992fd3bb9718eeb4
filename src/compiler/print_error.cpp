#include "compiler/Compiler.h"
#include "sema/Diagnostic.h"
#include <algorithm>
#include <cstring>
#include <fstream>
#include <string>
#include <string_view>
#include <vector>

extern "C" long write(int, const void *, unsigned long);

namespace gsc {
    static void write_str(const char *str) {
        if (str == nullptr) { return; }
        const auto len = std::strlen(str);
        (void) write(2, str, static_cast<unsigned long>(len));
    }

    static void write_str(const std::string_view strView) {
        (void) write(2, strView.data(), static_cast<unsigned long>(strView.size()));
    }

    static void write_int(const int value) {
        const auto str = std::to_string(value);
        (void) write(2, str.c_str(), static_cast<unsigned long>(str.size()));
    }

    // ANSI fragments
    static constexpr std::string_view kRed = "\033[31m";
    static constexpr std::string_view kMagenta = "\033[35m";
    static constexpr std::string_view kBold = "\033[1m";
    static constexpr std::string_view kReset = "\033[0m";

    static void print_header(const sema::Diagnostic &diag, const bool color) {
        if (diag.file.empty()) { return; }
        if (color) { write_str(kBold); }
        write_str(diag.file);
        write_str(":");
        write_int(diag.line);
        write_str(":");
        write_int(diag.col);
        write_str(": ");
        if (color) { write_str(kReset); }
    }

    static void print_label(const std::string_view label, const std::string_view ansi, const bool color) {
        if (color) {
            write_str(ansi);
            write_str(label);
            write_str(kReset);
        } else { write_str(label); }
    }

    // Up to `context` preceding lines, the offending line, then a caret under the column.
    static void print_source_with_caret(const sema::Diagnostic &diag, const int context) {
        if (diag.file.empty() || diag.line <= 0 || diag.col <= 0) { return; }
        std::ifstream input(diag.file);
        if (!input) { return; }
        const int first = std::max(1, diag.line - std::max(context - 1, 0));
        std::vector<std::string> lines;
        std::string lineStr;
        int curLine = 0;
        while (curLine < diag.line && std::getline(input, lineStr)) {
            ++curLine;
            if (curLine >= first) { lines.push_back(lineStr); }
        }
        if (curLine != diag.line) { return; }
        for (const auto &text : lines) {
            write_str("  ");
            write_str(text);
            write_str("\n");
        }
        write_str("  ");
        for (int i = 1; i < diag.col; ++i) { write_str(" "); }
        write_str("^\n");
    }

    static void print_function(const sema::Diagnostic &diag) {
        if (diag.function.empty()) { return; }
        write_str("  (in function '");
        write_str(diag.function);
        write_str("')\n");
    }

    void Compiler::print_error(const sema::Diagnostic &diag, const bool color, const int context) {
        print_header(diag, color);
        print_label("error: ", kRed, color);
        write_str(diag.message);
        write_str("\n");
        print_function(diag);
        if (context > 0) { print_source_with_caret(diag, context); }
    }

    void Compiler::print_warning(const sema::Diagnostic &diag, const bool color, const int context) {
        print_header(diag, color);
        print_label("warning: ", kMagenta, color);
        write_str(diag.message);
        write_str("\n");
        print_function(diag);
        if (context > 0) { print_source_with_caret(diag, context); }
    }
} // namespace gsc
