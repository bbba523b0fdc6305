// ============================================================
// TypeChecker 実装 - 文のチェック
// ============================================================

#include "../type_checker.hpp"

#include <fmt/format.h>

namespace jsema {

void TypeChecker::check_statement(const ast::Stmt& stmt) {
    debug::tc::log(debug::tc::Id::CheckStmt, fmt::format("line {}", stmt.line),
                   debug::Level::Trace);

    // 1つの文の解析失敗は警告に格下げし、走査を続ける
    try {
        if (auto* decl = stmt.as<ast::VarDeclStmt>()) {
            check_var_decl(decl->name, decl->type, decl->init.get(), stmt.line);
        } else if (auto* assign = stmt.as<ast::AssignStmt>()) {
            check_assign(*assign, stmt.line);
        } else if (auto* expr_stmt = stmt.as<ast::ExprStmt>()) {
            check_expression(require(expr_stmt->expr, "expression statement", "expression",
                                     stmt.line));
        } else if (auto* ret = stmt.as<ast::ReturnStmt>()) {
            if (ret->value) {
                check_expression(*ret->value);
            }
        } else if (auto* if_stmt = stmt.as<ast::IfStmt>()) {
            check_if(*if_stmt, stmt.line);
        } else if (auto* while_stmt = stmt.as<ast::WhileStmt>()) {
            check_while(*while_stmt, stmt.line);
        } else if (auto* do_while = stmt.as<ast::DoWhileStmt>()) {
            check_do_while(*do_while, stmt.line);
        } else if (auto* for_stmt = stmt.as<ast::ForStmt>()) {
            check_for(*for_stmt, stmt.line);
        } else if (auto* block = stmt.as<ast::BlockStmt>()) {
            for (const auto& s : block->stmts) {
                if (s) {
                    check_statement(*s);
                }
            }
        }
    } catch (const std::exception& e) {
        debug::tc::log(debug::tc::Id::NodeFailed, e.what(), debug::Level::Warn);
        warning(0, fmt::format("Error analyzing node: {}", e.what()));
    }
}

void TypeChecker::check_var_decl(const std::string& name, const std::string& type,
                                 const ast::Expr* init, int line) {
    if (!init)
        return;

    std::string init_type = expression_type(*init);
    if (!ast::is_unknown(init_type) && !is_assignment_compatible(init_type, type)) {
        error(line, fmt::format("Type mismatch in initialization of '{}': cannot assign {} to {}",
                                name, init_type, type));
    }
    check_expression(*init);
}

void TypeChecker::check_assign(const ast::AssignStmt& assign, int line) {
    const auto& value = require(assign.value, "assignment", "value", line);

    if (!assign.target_type.empty()) {
        check_assignment_type(assign.target, assign.target_type, value, line);
    } else {
        check_assignment(assign.target, value, line);
    }
    check_expression(value);
}

void TypeChecker::check_if(const ast::IfStmt& if_stmt, int line) {
    const auto& condition = require(if_stmt.condition, "if statement", "condition", line);
    check_condition(condition, "if", line);
    check_expression(condition);

    if (if_stmt.then_stmt) {
        check_statement(*if_stmt.then_stmt);
    }
    if (if_stmt.else_stmt) {
        check_statement(*if_stmt.else_stmt);
    }
}

void TypeChecker::check_while(const ast::WhileStmt& while_stmt, int line) {
    const auto& condition = require(while_stmt.condition, "while statement", "condition", line);
    check_condition(condition, "while", line);
    check_expression(condition);

    if (while_stmt.body) {
        check_statement(*while_stmt.body);
    }
}

void TypeChecker::check_do_while(const ast::DoWhileStmt& do_while, int line) {
    const auto& condition = require(do_while.condition, "do-while statement", "condition", line);
    check_condition(condition, "do-while", line);
    check_expression(condition);

    if (do_while.body) {
        check_statement(*do_while.body);
    }
}

void TypeChecker::check_for(const ast::ForStmt& for_stmt, int line) {
    if (for_stmt.init) {
        check_statement(*for_stmt.init);
    }
    // 条件なしのforは無限ループとして扱い、チェックしない
    if (for_stmt.condition) {
        check_condition(*for_stmt.condition, "for", line);
        check_expression(*for_stmt.condition);
    }
    if (for_stmt.update) {
        check_statement(*for_stmt.update);
    }
    if (for_stmt.body) {
        check_statement(*for_stmt.body);
    }
}

}  // namespace jsema
