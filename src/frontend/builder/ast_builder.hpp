#pragma once

// ============================================================
// AstBuilder
// パーサーのアクションから呼ばれ、ノード生成とシンボルテーブル更新を同時に行う。
// 識別子と代入先には、その時点で見える宣言型をノードに記録する。
// ============================================================

#include "../ast/decl.hpp"
#include "../types/scope.hpp"

#include <string>

namespace jsema {

class AstBuilder {
   public:
    explicit AstBuilder(SymbolTable& symbols) : symbols_(symbols) {}

    // トークンを記録
    void record_token(const std::string& kind, const std::string& lexeme, int line, int column);

    // メソッド本体・ブロックの開始/終了
    void begin_scope();
    void end_scope();

    // ローカル変数宣言（RedeclarationErrorはそのまま伝播）
    ast::StmtPtr declare_variable(const std::string& type, const std::string& name,
                                  ast::ExprPtr init, int line);

    // フィールド宣言
    ast::DeclPtr declare_field(const std::string& type, const std::string& name,
                               ast::ExprPtr init, int line);

    // メソッド引数（begin_scope後に呼ぶ）
    ast::Param declare_parameter(const std::string& type, const std::string& name, int line);

    // 識別子の参照（UseBeforeDeclarationErrorはそのまま伝播）
    ast::ExprPtr reference(const std::string& name, int line);

    // 代入文
    ast::StmtPtr assign(const std::string& name, ast::ExprPtr value, int line);

    int depth() const { return symbols_.depth(); }

   private:
    SymbolTable& symbols_;
};

}  // namespace jsema
