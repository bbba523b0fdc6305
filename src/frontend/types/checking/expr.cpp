// ============================================================
// TypeChecker 実装 - 式の型推論
// ============================================================

#include "../type_checker.hpp"

#include <fmt/format.h>

namespace jsema {

std::string TypeChecker::expression_type(const ast::Expr& expr) const {
    std::string inferred;

    if (auto* lit = expr.as<ast::LiteralExpr>()) {
        inferred = lit->type.empty() ? ast::UNKNOWN_TYPE : lit->type;
    } else if (auto* ident = expr.as<ast::IdentExpr>()) {
        inferred = infer_ident(*ident);
    } else if (auto* binary = expr.as<ast::BinaryExpr>()) {
        inferred = infer_binary(*binary);
    } else if (auto* unary = expr.as<ast::UnaryExpr>()) {
        inferred = infer_unary(*unary);
    } else {
        // メソッド呼び出し・メンバアクセスはシグネチャ情報がないため解決しない
        inferred = ast::UNKNOWN_TYPE;
    }

    debug::tc::log(debug::tc::Id::TypeInfer, fmt::format("line {} : {}", expr.line, inferred),
                   debug::Level::Trace);
    return inferred;
}

std::string TypeChecker::type_of(const ast::Expr* expr) const {
    if (!expr)
        return ast::UNKNOWN_TYPE;
    return expression_type(*expr);
}

std::string TypeChecker::infer_ident(const ast::IdentExpr& ident) const {
    // 構築時に記録した型を優先（スコープは既に閉じている可能性がある）
    if (!ident.resolved_type.empty()) {
        return ident.resolved_type;
    }

    const VariableInfo* info = symbols_.lookup(ident.name);
    if (!info) {
        return ast::UNKNOWN_TYPE;
    }
    debug::tc::log(debug::tc::Id::Resolved, ident.name + " : " + info->type,
                   debug::Level::Trace);
    return info->type;
}

std::string TypeChecker::infer_binary(const ast::BinaryExpr& binary) const {
    std::string left_type = type_of(binary.left.get());
    std::string right_type = type_of(binary.right.get());

    if (ast::is_relational(binary.op) || ast::is_equality(binary.op) ||
        ast::is_logical(binary.op)) {
        return "boolean";
    }

    return wider_type(left_type, right_type);
}

std::string TypeChecker::infer_unary(const ast::UnaryExpr& unary) const {
    if (unary.op == ast::UnaryOp::Not) {
        return "boolean";
    }
    // -x, ++x, x-- などはオペランドと同じ型
    return type_of(unary.operand.get());
}

void TypeChecker::check_binary_operation(ast::BinaryOp op, const ast::Expr& left,
                                         const ast::Expr& right, int line) {
    std::string left_type = expression_type(left);
    std::string right_type = expression_type(right);

    // 型が不明なオペランドがあればチェックしない
    if (ast::is_unknown(left_type) || ast::is_unknown(right_type)) {
        return;
    }

    const char* op_str = ast::binary_op_str(op);

    if (ast::is_relational(op)) {
        if (!ast::is_numeric(left_type) || !ast::is_numeric(right_type)) {
            error(line,
                  fmt::format("Relational operator '{}' requires numeric operands, got {} and {}",
                              op_str, left_type, right_type));
        }
    } else if (ast::is_equality(op)) {
        if (left_type != right_type && !is_assignment_compatible(left_type, right_type) &&
            !is_assignment_compatible(right_type, left_type)) {
            warning(line,
                    fmt::format("Comparing incompatible types: {} and {}", left_type, right_type));
        }
    } else if (ast::is_logical(op)) {
        if (left_type != "boolean") {
            error(line, fmt::format(
                            "Logical operator '{}' requires boolean operands, left operand is {}",
                            op_str, left_type));
        }
        if (right_type != "boolean") {
            error(line, fmt::format(
                            "Logical operator '{}' requires boolean operands, right operand is {}",
                            op_str, right_type));
        }
    } else if (ast::is_arithmetic(op)) {
        if (!is_arithmetic_operand(op, left_type)) {
            error(line, fmt::format(
                            "Arithmetic operator '{}' requires numeric operands, left operand is {}",
                            op_str, left_type));
        }
        if (!is_arithmetic_operand(op, right_type)) {
            error(line,
                  fmt::format(
                      "Arithmetic operator '{}' requires numeric operands, right operand is {}",
                      op_str, right_type));
        }
    }
}

// 式を前順で走査し、含まれる二項演算をすべて検査する
void TypeChecker::check_expression(const ast::Expr& expr) {
    debug::tc::log(debug::tc::Id::CheckExpr, "", debug::Level::Trace);

    try {
        if (auto* binary = expr.as<ast::BinaryExpr>()) {
            const auto& left = require(binary->left, "binary expression", "left operand", expr.line);
            const auto& right =
                require(binary->right, "binary expression", "right operand", expr.line);
            check_binary_operation(binary->op, left, right, expr.line);
            check_expression(left);
            check_expression(right);
        } else if (auto* unary = expr.as<ast::UnaryExpr>()) {
            check_expression(require(unary->operand, "unary expression", "operand", expr.line));
        } else if (auto* call = expr.as<ast::CallExpr>()) {
            if (call->object) {
                check_expression(*call->object);
            }
            for (const auto& arg : call->args) {
                check_expression(require(arg, "method call", "argument", expr.line));
            }
        } else if (auto* member = expr.as<ast::MemberExpr>()) {
            check_expression(require(member->object, "member access", "object", expr.line));
        }
    } catch (const std::exception& e) {
        debug::tc::log(debug::tc::Id::NodeFailed, e.what(), debug::Level::Warn);
        warning(0, fmt::format("Error analyzing node: {}", e.what()));
    }
}

}  // namespace jsema
