// ============================================================
// TypeChecker 実装 - 宣言の走査
// ============================================================

#include "../type_checker.hpp"

#include <fmt/format.h>

namespace jsema {

void TypeChecker::analyze(const ast::Program& program) {
    debug::tc::log(debug::tc::Id::Start, program.filename);

    for (const auto& decl : program.classes) {
        if (decl) {
            check_declaration(*decl);
        }
    }

    debug::tc::log(debug::tc::Id::End, fmt::format("{} error(s), {} warning(s)",
                                                   diagnostics_.error_count(),
                                                   diagnostics_.warning_count()));
}

void TypeChecker::check_declaration(const ast::Decl& decl) {
    debug::tc::log(debug::tc::Id::CheckDecl, fmt::format("line {}", decl.line),
                   debug::Level::Trace);

    try {
        if (auto* cls = decl.as<ast::ClassDecl>()) {
            check_class(*cls);
        } else if (auto* method = decl.as<ast::MethodDecl>()) {
            check_method(*method);
        } else if (auto* field = decl.as<ast::FieldDecl>()) {
            check_field(*field, decl.line);
        }
    } catch (const std::exception& e) {
        debug::tc::log(debug::tc::Id::NodeFailed, e.what(), debug::Level::Warn);
        warning(0, fmt::format("Error analyzing node: {}", e.what()));
    }
}

void TypeChecker::check_class(const ast::ClassDecl& cls) {
    debug::tc::log(debug::tc::Id::CheckDecl, "class " + cls.name);
    for (const auto& member : cls.members) {
        if (member) {
            check_declaration(*member);
        }
    }
}

void TypeChecker::check_method(const ast::MethodDecl& method) {
    debug::tc::log(debug::tc::Id::CheckDecl, "method " + method.name);
    for (const auto& stmt : method.statements) {
        if (stmt) {
            check_statement(*stmt);
        }
    }
}

void TypeChecker::check_field(const ast::FieldDecl& field, int line) {
    check_var_decl(field.name, field.type, field.init.get(), line);
}

}  // namespace jsema
