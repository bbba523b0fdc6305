// ============================================================
// TypeChecker 実装 - ユーティリティ関数
// ============================================================

#include "../type_checker.hpp"

#include <fmt/format.h>
#include <stdexcept>
#include <unordered_map>
#include <unordered_set>

namespace jsema {

namespace {

// 暗黙の拡大変換が許される代入先（from → 代入可能なto）
const std::unordered_map<std::string, std::unordered_set<std::string>>& compatible_types() {
    static const std::unordered_map<std::string, std::unordered_set<std::string>> table = {
        {"byte", {"byte", "short", "int", "long", "float", "double"}},
        {"short", {"short", "int", "long", "float", "double"}},
        {"int", {"int", "long", "float", "double"}},
        {"long", {"long", "float", "double"}},
        {"float", {"float", "double"}},
        {"double", {"double"}},
        {"char", {"char", "int", "long", "float", "double"}},
        {"boolean", {"boolean"}},
        {"String", {"String"}},
    };
    return table;
}

}  // namespace

TypeChecker::TypeChecker(const SymbolTable& symbols, CheckerConfig config)
    : symbols_(symbols), config_(config) {}

bool TypeChecker::is_assignment_compatible(const std::string& from, const std::string& to) const {
    if (ast::is_unknown(from) || ast::is_unknown(to))
        return false;

    if (from == to)
        return true;

    const auto& table = compatible_types();
    auto it = table.find(from);
    if (it != table.end()) {
        return it->second.count(to) > 0;
    }
    return false;
}

std::string TypeChecker::wider_type(const std::string& a, const std::string& b) const {
    int rank_a = ast::promotion_rank(ast::type_kind(a));
    int rank_b = ast::promotion_rank(ast::type_kind(b));
    if (rank_a < 0 || rank_b < 0)
        return ast::UNKNOWN_TYPE;
    return rank_a >= rank_b ? a : b;
}

void TypeChecker::check_assignment(const std::string& var_name, const ast::Expr& expr, int line) {
    const VariableInfo* info = symbols_.lookup(var_name);
    if (!info) {
        error(line, fmt::format("Variable '{}' not declared", var_name));
        return;
    }
    check_assignment_type(var_name, info->type, expr, line);
}

void TypeChecker::check_assignment_type(const std::string& var_name, const std::string& var_type,
                                        const ast::Expr& expr, int line) {
    std::string expr_type = expression_type(expr);

    if (ast::is_unknown(expr_type)) {
        warning(line, fmt::format("Cannot determine type of expression in assignment to '{}'",
                                  var_name));
        return;
    }

    if (!is_assignment_compatible(expr_type, var_type)) {
        error(line, fmt::format("Type mismatch: cannot assign {} to {} in variable '{}'", expr_type,
                                var_type, var_name));
    }
}

void TypeChecker::check_condition(const ast::Expr& condition, const std::string& statement_kind,
                                  int line) {
    std::string cond_type = expression_type(condition);

    if (ast::is_unknown(cond_type)) {
        warning(line, fmt::format("Cannot determine type of {} condition", statement_kind));
        return;
    }

    if (cond_type != "boolean") {
        error(line, fmt::format("{} condition must be boolean, got {}", statement_kind, cond_type));
    }
}

bool TypeChecker::is_arithmetic_operand(ast::BinaryOp op, const std::string& type) const {
    if (ast::is_numeric(type))
        return true;
    if (type != "String")
        return false;
    // String は全算術演算子で許可（strict時は連結のみ）
    return !config_.strict_string_arithmetic || op == ast::BinaryOp::Add;
}

void TypeChecker::print_results(std::ostream& out) const {
    out << "TYPE CHECKING RESULTS\n";
    out << "========================================\n";

    auto errs = errors();
    auto warns = warnings();
    if (errs.empty() && warns.empty()) {
        out << " No type errors found!\n";
    } else {
        if (!errs.empty()) {
            out << "\n TYPE ERRORS:\n";
            for (const auto& e : errs) {
                out << "  " << e << "\n";
            }
        }
        if (!warns.empty()) {
            out << "\n TYPE WARNINGS:\n";
            for (const auto& w : warns) {
                out << "  " << w << "\n";
            }
        }
    }
    out << "\n";
}

void TypeChecker::error(int line, const std::string& msg) {
    debug::tc::log(debug::tc::Id::TypeError, msg, debug::Level::Debug);
    diagnostics_.error(line, msg);
}

void TypeChecker::warning(int line, const std::string& msg) {
    debug::tc::log(debug::tc::Id::TypeWarning, msg, debug::Level::Debug);
    diagnostics_.warning(line, msg);
}

const ast::Expr& TypeChecker::require(const ast::ExprPtr& child, const char* node_kind,
                                      const char* child_name, int line) {
    if (!child) {
        throw std::invalid_argument(
            fmt::format("{} at line {} has no {}", node_kind, line, child_name));
    }
    return *child;
}

}  // namespace jsema
