// ============================================================
// Diagnostics 実装
// ============================================================

#include "diagnostics.hpp"

#include <fmt/format.h>

namespace jsema {

std::string Diagnostic::to_string() const {
    if (line <= 0) {
        return message;
    }
    return fmt::format("Line {}: {}", line, message);
}

std::vector<std::string> Diagnostics::messages(Severity severity) const {
    std::vector<std::string> result;
    for (const auto& diag : diagnostics_) {
        if (diag.severity == severity) {
            result.push_back(diag.to_string());
        }
    }
    return result;
}

void Diagnostics::print(std::ostream& out) const {
    const char* color_reset = "\033[0m";
    const char* color_bold = "\033[1m";
    const char* color_red = "\033[31m";
    const char* color_yellow = "\033[33m";

    for (const auto& diag : diagnostics_) {
        switch (diag.severity) {
            case Severity::Error:
                out << color_bold << color_red << "error: " << color_reset;
                break;
            case Severity::Warning:
                out << color_bold << color_yellow << "warning: " << color_reset;
                break;
        }
        out << diag.to_string() << "\n";
    }

    // サマリー
    if (error_count_ > 0 || warning_count_ > 0) {
        out << "\n";
        if (error_count_ > 0) {
            out << "error: " << error_count_ << " error(s)";
        }
        if (warning_count_ > 0) {
            if (error_count_ > 0)
                out << ", ";
            out << warning_count_ << " warning(s)";
        }
        out << " generated.\n";
    }
}

}  // namespace jsema
