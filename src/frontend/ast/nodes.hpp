#pragma once

#include "types.hpp"

#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace jsema::ast {

// ============================================================
// 前方宣言
// ============================================================
struct Expr;
struct Stmt;
struct Decl;

using ExprPtr = std::unique_ptr<Expr>;
using StmtPtr = std::unique_ptr<Stmt>;
using DeclPtr = std::unique_ptr<Decl>;

// ============================================================
// ASTノード基底
// ============================================================
struct Node {
    int line = 0;  // ソース行（1始まり）

    Node() = default;
    explicit Node(int ln) : line(ln) {}
    virtual ~Node() = default;
};

// ============================================================
// 式（Expression）
// ============================================================
struct LiteralExpr;
struct IdentExpr;
struct BinaryExpr;
struct UnaryExpr;
struct CallExpr;
struct MemberExpr;

// 式の種類
using ExprKind =
    std::variant<std::unique_ptr<LiteralExpr>, std::unique_ptr<IdentExpr>,
                 std::unique_ptr<BinaryExpr>, std::unique_ptr<UnaryExpr>,
                 std::unique_ptr<CallExpr>, std::unique_ptr<MemberExpr>>;

struct Expr : Node {
    ExprKind kind;

    template <typename T>
    Expr(std::unique_ptr<T> k, int ln = 0) : Node(ln), kind(std::move(k)) {}

    template <typename T>
    T* as() {
        if (auto* p = std::get_if<std::unique_ptr<T>>(&kind)) {
            return p->get();
        }
        return nullptr;
    }

    template <typename T>
    const T* as() const {
        if (auto* p = std::get_if<std::unique_ptr<T>>(&kind)) {
            return p->get();
        }
        return nullptr;
    }
};

// ============================================================
// 文（Statement）
// ============================================================
struct VarDeclStmt;
struct AssignStmt;
struct ExprStmt;
struct ReturnStmt;
struct IfStmt;
struct WhileStmt;
struct DoWhileStmt;
struct ForStmt;
struct BlockStmt;

using StmtKind =
    std::variant<std::unique_ptr<VarDeclStmt>, std::unique_ptr<AssignStmt>,
                 std::unique_ptr<ExprStmt>, std::unique_ptr<ReturnStmt>,
                 std::unique_ptr<IfStmt>, std::unique_ptr<WhileStmt>,
                 std::unique_ptr<DoWhileStmt>, std::unique_ptr<ForStmt>,
                 std::unique_ptr<BlockStmt>>;

struct Stmt : Node {
    StmtKind kind;

    template <typename T>
    Stmt(std::unique_ptr<T> k, int ln = 0) : Node(ln), kind(std::move(k)) {}

    template <typename T>
    T* as() {
        if (auto* p = std::get_if<std::unique_ptr<T>>(&kind)) {
            return p->get();
        }
        return nullptr;
    }

    template <typename T>
    const T* as() const {
        if (auto* p = std::get_if<std::unique_ptr<T>>(&kind)) {
            return p->get();
        }
        return nullptr;
    }
};

// ============================================================
// 宣言（Declaration）
// ============================================================
struct ClassDecl;
struct MethodDecl;
struct FieldDecl;

using DeclKind = std::variant<std::unique_ptr<ClassDecl>, std::unique_ptr<MethodDecl>,
                              std::unique_ptr<FieldDecl>>;

struct Decl : Node {
    DeclKind kind;

    template <typename T>
    Decl(std::unique_ptr<T> k, int ln = 0) : Node(ln), kind(std::move(k)) {}

    template <typename T>
    T* as() {
        if (auto* p = std::get_if<std::unique_ptr<T>>(&kind)) {
            return p->get();
        }
        return nullptr;
    }

    template <typename T>
    const T* as() const {
        if (auto* p = std::get_if<std::unique_ptr<T>>(&kind)) {
            return p->get();
        }
        return nullptr;
    }
};

// ============================================================
// プログラム（ルートノード）
// ============================================================
struct Program : Node {
    std::vector<DeclPtr> classes;
    std::string filename;

    Program() = default;
    explicit Program(std::string file) : filename(std::move(file)) {}
};

}  // namespace jsema::ast
