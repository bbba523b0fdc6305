#pragma once

// ============================================================
// TypeChecker メインクラス定義
// ============================================================

#include "base.hpp"

namespace jsema {

class TypeChecker {
   public:
    explicit TypeChecker(const SymbolTable& symbols, CheckerConfig config = CheckerConfig{});

    // プログラム全体をチェック（エラーがあっても最後まで走査する）
    void analyze(const ast::Program& program);

    // ============================================================
    // 型の互換性・推論
    // ============================================================

    // from型の値をto型の変数に代入できるか
    bool is_assignment_compatible(const std::string& from, const std::string& to) const;

    // 式の型を推論（決定できなければ "unknown"）
    std::string expression_type(const ast::Expr& expr) const;

    // 数値昇格で広い方の型（順序外なら "unknown"）
    std::string wider_type(const std::string& a, const std::string& b) const;

    // ============================================================
    // 個別チェック
    // ============================================================
    void check_assignment(const std::string& var_name, const ast::Expr& expr, int line);
    void check_binary_operation(ast::BinaryOp op, const ast::Expr& left, const ast::Expr& right,
                                int line);
    void check_condition(const ast::Expr& condition, const std::string& statement_kind, int line);

    // ============================================================
    // 診断情報
    // ============================================================
    std::vector<std::string> errors() const { return diagnostics_.messages(Severity::Error); }
    std::vector<std::string> warnings() const {
        return diagnostics_.messages(Severity::Warning);
    }
    bool has_errors() const { return diagnostics_.has_errors(); }
    const Diagnostics& diagnostics() const { return diagnostics_; }

    void print_results(std::ostream& out = std::cout) const;

   private:
    // ============================================================
    // 宣言のチェック (decl.cpp)
    // ============================================================
    void check_declaration(const ast::Decl& decl);
    void check_class(const ast::ClassDecl& cls);
    void check_method(const ast::MethodDecl& method);
    void check_field(const ast::FieldDecl& field, int line);

    // ============================================================
    // 文のチェック (stmt.cpp)
    // ============================================================
    void check_statement(const ast::Stmt& stmt);
    void check_var_decl(const std::string& name, const std::string& type, const ast::Expr* init,
                        int line);
    void check_assign(const ast::AssignStmt& assign, int line);
    void check_if(const ast::IfStmt& if_stmt, int line);
    void check_while(const ast::WhileStmt& while_stmt, int line);
    void check_do_while(const ast::DoWhileStmt& do_while, int line);
    void check_for(const ast::ForStmt& for_stmt, int line);

    // ============================================================
    // 式の型推論・走査 (expr.cpp)
    // ============================================================
    void check_expression(const ast::Expr& expr);
    std::string infer_ident(const ast::IdentExpr& ident) const;
    std::string infer_binary(const ast::BinaryExpr& binary) const;
    std::string infer_unary(const ast::UnaryExpr& unary) const;
    std::string type_of(const ast::Expr* expr) const;

    // ============================================================
    // ユーティリティ (utils.cpp)
    // ============================================================
    void check_assignment_type(const std::string& var_name, const std::string& var_type,
                               const ast::Expr& expr, int line);
    bool is_arithmetic_operand(ast::BinaryOp op, const std::string& type) const;
    void error(int line, const std::string& msg);
    void warning(int line, const std::string& msg);

    // 必須の子ノードを取得（欠けていれば std::invalid_argument）
    static const ast::Expr& require(const ast::ExprPtr& child, const char* node_kind,
                                    const char* child_name, int line);

    // ============================================================
    // メンバ変数
    // ============================================================
    const SymbolTable& symbols_;
    CheckerConfig config_;
    Diagnostics diagnostics_;
};

}  // namespace jsema
