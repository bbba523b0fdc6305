// ============================================================
// AstBuilder 実装
// ============================================================

#include "ast_builder.hpp"

#include "../../common/debug/ast.hpp"

#include <fmt/format.h>

namespace jsema {

void AstBuilder::record_token(const std::string& kind, const std::string& lexeme, int line,
                              int column) {
    symbols_.add_token(kind, lexeme, line, column);
}

void AstBuilder::begin_scope() {
    symbols_.enter_scope();
}

void AstBuilder::end_scope() {
    symbols_.exit_scope();
}

ast::StmtPtr AstBuilder::declare_variable(const std::string& type, const std::string& name,
                                          ast::ExprPtr init, int line) {
    symbols_.declare(name, type, line);
    debug::ast::log(debug::ast::Id::Declaration, fmt::format("{} {} (line {})", type, name, line));
    return ast::make_var_decl(type, name, std::move(init), line);
}

ast::DeclPtr AstBuilder::declare_field(const std::string& type, const std::string& name,
                                       ast::ExprPtr init, int line) {
    symbols_.declare(name, type, line);
    debug::ast::log(debug::ast::Id::Declaration,
                    fmt::format("field {} {} (line {})", type, name, line));
    return ast::make_field(type, name, std::move(init), line);
}

ast::Param AstBuilder::declare_parameter(const std::string& type, const std::string& name,
                                         int line) {
    symbols_.declare(name, type, line);
    debug::ast::log(debug::ast::Id::Declaration,
                    fmt::format("param {} {} (line {})", type, name, line));
    return ast::Param{name, type, line};
}

ast::ExprPtr AstBuilder::reference(const std::string& name, int line) {
    symbols_.mark_used(name, line);
    // mark_usedが成功したのでlookupは必ず見つかる
    std::string type = symbols_.lookup(name)->type;
    debug::ast::log(debug::ast::Id::Reference, fmt::format("{} : {} (line {})", name, type, line),
                    debug::Level::Trace);
    return std::make_unique<ast::Expr>(std::make_unique<ast::IdentExpr>(name, type), line);
}

ast::StmtPtr AstBuilder::assign(const std::string& name, ast::ExprPtr value, int line) {
    symbols_.mark_used(name, line);
    std::string type = symbols_.lookup(name)->type;
    debug::ast::log(debug::ast::Id::Assignment, fmt::format("{} : {} (line {})", name, type, line),
                    debug::Level::Trace);
    return std::make_unique<ast::Stmt>(
        std::make_unique<ast::AssignStmt>(name, std::move(value), type), line);
}

}  // namespace jsema
