#pragma once

#include "nodes.hpp"

#include <cstdint>
#include <optional>

namespace jsema::ast {

// ============================================================
// リテラル値
// 型はレクサーが決めた名前をそのまま保持する（"int", "String" 等）
// ============================================================
struct LiteralExpr {
    std::string type;
    std::string value;  // ソース上の字句

    LiteralExpr(std::string t, std::string v) : type(std::move(t)), value(std::move(v)) {}
};

// ============================================================
// 識別子
// ============================================================
struct IdentExpr {
    std::string name;
    std::string resolved_type;  // 構築時に解決した宣言型（空なら未記録）

    explicit IdentExpr(std::string n, std::string t = {})
        : name(std::move(n)), resolved_type(std::move(t)) {}
};

// ============================================================
// 二項演算子
// ============================================================
enum class BinaryOp {
    // 算術
    Add,
    Sub,
    Mul,
    Div,
    Mod,
    // ビット
    BitAnd,
    BitOr,
    BitXor,
    Shl,
    Shr,
    // 論理
    And,
    Or,
    // 比較
    Eq,
    Ne,
    Lt,
    Gt,
    Le,
    Ge,
};

inline const char* binary_op_str(BinaryOp op) {
    switch (op) {
        case BinaryOp::Add:
            return "+";
        case BinaryOp::Sub:
            return "-";
        case BinaryOp::Mul:
            return "*";
        case BinaryOp::Div:
            return "/";
        case BinaryOp::Mod:
            return "%";
        case BinaryOp::BitAnd:
            return "&";
        case BinaryOp::BitOr:
            return "|";
        case BinaryOp::BitXor:
            return "^";
        case BinaryOp::Shl:
            return "<<";
        case BinaryOp::Shr:
            return ">>";
        case BinaryOp::And:
            return "&&";
        case BinaryOp::Or:
            return "||";
        case BinaryOp::Eq:
            return "==";
        case BinaryOp::Ne:
            return "!=";
        case BinaryOp::Lt:
            return "<";
        case BinaryOp::Gt:
            return ">";
        case BinaryOp::Le:
            return "<=";
        case BinaryOp::Ge:
            return ">=";
    }
    return "?";
}

/// 演算子の字句から変換（パーサー側から使用）
inline std::optional<BinaryOp> parse_binary_op(const std::string& s) {
    static const BinaryOp all[] = {
        BinaryOp::Add,    BinaryOp::Sub,   BinaryOp::Mul,    BinaryOp::Div, BinaryOp::Mod,
        BinaryOp::BitAnd, BinaryOp::BitOr, BinaryOp::BitXor, BinaryOp::Shl, BinaryOp::Shr,
        BinaryOp::And,    BinaryOp::Or,    BinaryOp::Eq,     BinaryOp::Ne,  BinaryOp::Lt,
        BinaryOp::Gt,     BinaryOp::Le,    BinaryOp::Ge,
    };
    for (auto op : all) {
        if (s == binary_op_str(op)) {
            return op;
        }
    }
    return std::nullopt;
}

inline bool is_relational(BinaryOp op) {
    return op == BinaryOp::Lt || op == BinaryOp::Gt || op == BinaryOp::Le || op == BinaryOp::Ge;
}

inline bool is_equality(BinaryOp op) {
    return op == BinaryOp::Eq || op == BinaryOp::Ne;
}

inline bool is_logical(BinaryOp op) {
    return op == BinaryOp::And || op == BinaryOp::Or;
}

inline bool is_arithmetic(BinaryOp op) {
    return op == BinaryOp::Add || op == BinaryOp::Sub || op == BinaryOp::Mul ||
           op == BinaryOp::Div || op == BinaryOp::Mod;
}

struct BinaryExpr {
    BinaryOp op;
    ExprPtr left;
    ExprPtr right;

    BinaryExpr(BinaryOp o, ExprPtr l, ExprPtr r) : op(o), left(std::move(l)), right(std::move(r)) {}
};

// ============================================================
// 単項演算子
// ============================================================
enum class UnaryOp {
    Neg,      // -
    Plus,     // +
    Not,      // !
    BitNot,   // ~
    PreInc,   // ++x
    PreDec,   // --x
    PostInc,  // x++
    PostDec,  // x--
};

inline const char* unary_op_str(UnaryOp op) {
    switch (op) {
        case UnaryOp::Neg:
            return "-";
        case UnaryOp::Plus:
            return "+";
        case UnaryOp::Not:
            return "!";
        case UnaryOp::BitNot:
            return "~";
        case UnaryOp::PreInc:
            return "++";
        case UnaryOp::PreDec:
            return "--";
        case UnaryOp::PostInc:
            return "++";
        case UnaryOp::PostDec:
            return "--";
    }
    return "?";
}

struct UnaryExpr {
    UnaryOp op;
    ExprPtr operand;

    UnaryExpr(UnaryOp o, ExprPtr e) : op(o), operand(std::move(e)) {}
};

// ============================================================
// メソッド呼び出し（object.method(args) または method(args)）
// ============================================================
struct CallExpr {
    ExprPtr object;  // nullなら修飾なし
    std::string method;
    std::vector<ExprPtr> args;

    CallExpr(ExprPtr o, std::string m, std::vector<ExprPtr> a)
        : object(std::move(o)), method(std::move(m)), args(std::move(a)) {}
};

// ============================================================
// メンバアクセス
// ============================================================
struct MemberExpr {
    ExprPtr object;
    std::string member;

    MemberExpr(ExprPtr o, std::string m) : object(std::move(o)), member(std::move(m)) {}
};

// ============================================================
// 式作成ヘルパー
// ============================================================
inline ExprPtr make_literal(std::string type, std::string value, int line = 0) {
    return std::make_unique<Expr>(
        std::make_unique<LiteralExpr>(std::move(type), std::move(value)), line);
}

inline ExprPtr make_int_literal(int64_t v, int line = 0) {
    return make_literal("int", std::to_string(v), line);
}

inline ExprPtr make_double_literal(const std::string& v, int line = 0) {
    return make_literal("double", v, line);
}

inline ExprPtr make_bool_literal(bool v, int line = 0) {
    return make_literal("boolean", v ? "true" : "false", line);
}

inline ExprPtr make_char_literal(char v, int line = 0) {
    return make_literal("char", std::string(1, v), line);
}

inline ExprPtr make_string_literal(std::string v, int line = 0) {
    return make_literal("String", std::move(v), line);
}

inline ExprPtr make_ident(std::string name, int line = 0) {
    return std::make_unique<Expr>(std::make_unique<IdentExpr>(std::move(name)), line);
}

inline ExprPtr make_binary(BinaryOp op, ExprPtr left, ExprPtr right, int line = 0) {
    return std::make_unique<Expr>(
        std::make_unique<BinaryExpr>(op, std::move(left), std::move(right)), line);
}

inline ExprPtr make_unary(UnaryOp op, ExprPtr operand, int line = 0) {
    return std::make_unique<Expr>(std::make_unique<UnaryExpr>(op, std::move(operand)), line);
}

inline ExprPtr make_call(ExprPtr object, std::string method, std::vector<ExprPtr> args,
                         int line = 0) {
    return std::make_unique<Expr>(
        std::make_unique<CallExpr>(std::move(object), std::move(method), std::move(args)), line);
}

inline ExprPtr make_member(ExprPtr object, std::string member, int line = 0) {
    return std::make_unique<Expr>(
        std::make_unique<MemberExpr>(std::move(object), std::move(member)), line);
}

}  // namespace jsema::ast
