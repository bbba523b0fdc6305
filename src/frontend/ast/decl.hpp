#pragma once

#include "stmt.hpp"

namespace jsema::ast {

// ============================================================
// メソッド引数
// ============================================================
struct Param {
    std::string name;
    std::string type;
    int line = 0;
};

// ============================================================
// メソッド宣言
// ============================================================
struct MethodDecl {
    std::string name;
    std::string return_type;
    std::vector<Param> params;
    std::vector<StmtPtr> statements;
    bool is_static = false;

    MethodDecl(std::string n, std::string rt, std::vector<Param> p, std::vector<StmtPtr> s)
        : name(std::move(n)),
          return_type(std::move(rt)),
          params(std::move(p)),
          statements(std::move(s)) {}
};

// ============================================================
// フィールド宣言（クラス直下の変数）
// ============================================================
struct FieldDecl {
    std::string name;
    std::string type;
    ExprPtr init;  // 初期化式（省略可）
    bool is_static = false;

    FieldDecl(std::string n, std::string t, ExprPtr i)
        : name(std::move(n)), type(std::move(t)), init(std::move(i)) {}
};

// ============================================================
// クラス宣言
// ============================================================
struct ClassDecl {
    std::string name;
    std::vector<DeclPtr> members;  // MethodDecl / FieldDecl

    ClassDecl(std::string n, std::vector<DeclPtr> m)
        : name(std::move(n)), members(std::move(m)) {}
};

// ============================================================
// 宣言作成ヘルパー
// ============================================================
inline DeclPtr make_class(std::string name, std::vector<DeclPtr> members, int line = 0) {
    return std::make_unique<Decl>(std::make_unique<ClassDecl>(std::move(name), std::move(members)),
                                  line);
}

inline DeclPtr make_method(std::string name, std::string return_type, std::vector<Param> params,
                           std::vector<StmtPtr> statements, int line = 0) {
    return std::make_unique<Decl>(
        std::make_unique<MethodDecl>(std::move(name), std::move(return_type), std::move(params),
                                     std::move(statements)),
        line);
}

inline DeclPtr make_field(std::string type, std::string name, ExprPtr init, int line = 0) {
    return std::make_unique<Decl>(
        std::make_unique<FieldDecl>(std::move(name), std::move(type), std::move(init)), line);
}

}  // namespace jsema::ast
