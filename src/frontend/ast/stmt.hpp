#pragma once

#include "expr.hpp"
#include "nodes.hpp"

namespace jsema::ast {

// ============================================================
// 変数宣言
// ============================================================
struct VarDeclStmt {
    std::string name;
    std::string type;
    ExprPtr init;  // 初期化式（省略可）

    VarDeclStmt(std::string n, std::string t, ExprPtr i)
        : name(std::move(n)), type(std::move(t)), init(std::move(i)) {}
};

// ============================================================
// 代入文
// ============================================================
struct AssignStmt {
    std::string target;
    ExprPtr value;
    std::string target_type;  // 構築時に解決した代入先の型（空なら未記録）

    AssignStmt(std::string t, ExprPtr v, std::string tt = {})
        : target(std::move(t)), value(std::move(v)), target_type(std::move(tt)) {}
};

// ============================================================
// 式文
// ============================================================
struct ExprStmt {
    ExprPtr expr;

    explicit ExprStmt(ExprPtr e) : expr(std::move(e)) {}
};

// ============================================================
// return文
// ============================================================
struct ReturnStmt {
    ExprPtr value;  // nullならreturn;

    ReturnStmt() = default;
    explicit ReturnStmt(ExprPtr v) : value(std::move(v)) {}
};

// ============================================================
// if文
// ============================================================
struct IfStmt {
    ExprPtr condition;
    StmtPtr then_stmt;
    StmtPtr else_stmt;  // else ifの場合は単一のIfStmt

    IfStmt(ExprPtr c, StmtPtr t, StmtPtr e = nullptr)
        : condition(std::move(c)), then_stmt(std::move(t)), else_stmt(std::move(e)) {}
};

// ============================================================
// while文
// ============================================================
struct WhileStmt {
    ExprPtr condition;
    StmtPtr body;

    WhileStmt(ExprPtr c, StmtPtr b) : condition(std::move(c)), body(std::move(b)) {}
};

// ============================================================
// do-while文
// ============================================================
struct DoWhileStmt {
    ExprPtr condition;
    StmtPtr body;

    DoWhileStmt(ExprPtr c, StmtPtr b) : condition(std::move(c)), body(std::move(b)) {}
};

// ============================================================
// for文
// ============================================================
struct ForStmt {
    StmtPtr init;       // nullまたはVarDeclStmt/AssignStmt
    ExprPtr condition;  // nullなら無限ループ
    StmtPtr update;     // nullまたはAssignStmt/ExprStmt
    StmtPtr body;

    ForStmt(StmtPtr i, ExprPtr c, StmtPtr u, StmtPtr b)
        : init(std::move(i)), condition(std::move(c)), update(std::move(u)), body(std::move(b)) {}
};

// ============================================================
// ブロック文
// ============================================================
struct BlockStmt {
    std::vector<StmtPtr> stmts;

    BlockStmt() = default;
    explicit BlockStmt(std::vector<StmtPtr> s) : stmts(std::move(s)) {}
};

// ============================================================
// 文作成ヘルパー
// ============================================================
inline StmtPtr make_var_decl(std::string type, std::string name, ExprPtr init, int line = 0) {
    return std::make_unique<Stmt>(
        std::make_unique<VarDeclStmt>(std::move(name), std::move(type), std::move(init)), line);
}

inline StmtPtr make_assign(std::string target, ExprPtr value, int line = 0) {
    return std::make_unique<Stmt>(std::make_unique<AssignStmt>(std::move(target), std::move(value)),
                                  line);
}

inline StmtPtr make_expr_stmt(ExprPtr expr, int line = 0) {
    return std::make_unique<Stmt>(std::make_unique<ExprStmt>(std::move(expr)), line);
}

inline StmtPtr make_return(ExprPtr value, int line = 0) {
    return std::make_unique<Stmt>(std::make_unique<ReturnStmt>(std::move(value)), line);
}

inline StmtPtr make_if(ExprPtr cond, StmtPtr then_stmt, StmtPtr else_stmt = nullptr,
                       int line = 0) {
    return std::make_unique<Stmt>(
        std::make_unique<IfStmt>(std::move(cond), std::move(then_stmt), std::move(else_stmt)),
        line);
}

inline StmtPtr make_while(ExprPtr cond, StmtPtr body, int line = 0) {
    return std::make_unique<Stmt>(std::make_unique<WhileStmt>(std::move(cond), std::move(body)),
                                  line);
}

inline StmtPtr make_do_while(ExprPtr cond, StmtPtr body, int line = 0) {
    return std::make_unique<Stmt>(std::make_unique<DoWhileStmt>(std::move(cond), std::move(body)),
                                  line);
}

inline StmtPtr make_for(StmtPtr init, ExprPtr cond, StmtPtr update, StmtPtr body, int line = 0) {
    return std::make_unique<Stmt>(std::make_unique<ForStmt>(std::move(init), std::move(cond),
                                                            std::move(update), std::move(body)),
                                  line);
}

inline StmtPtr make_block(std::vector<StmtPtr> stmts, int line = 0) {
    return std::make_unique<Stmt>(std::make_unique<BlockStmt>(std::move(stmts)), line);
}

}  // namespace jsema::ast
