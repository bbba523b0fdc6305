#pragma once

#include <iostream>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace jsema {

// ============================================================
// 変数情報
// ============================================================
struct VariableInfo {
    std::string name;
    std::string type;
    int line = 0;
    bool used = false;
    int scope_level = 0;  // 宣言時のスコープ深さ（0 = グローバル）
};

// ============================================================
// トークン記録（外部レクサーから受け取る）
// ============================================================
struct TokenRecord {
    std::string kind;
    std::string lexeme;
    int line = 0;
    int column = 0;
};

// ============================================================
// シンボルテーブルの致命的エラー
// 構築中に送出され、呼び出し側まで伝播する
// ============================================================
class SymbolError : public std::runtime_error {
   public:
    enum class Kind {
        Redeclaration,
        UseBeforeDeclaration,
    };

    SymbolError(Kind kind, std::string name, int line, const std::string& message)
        : std::runtime_error(message), kind_(kind), name_(std::move(name)), line_(line) {}

    Kind kind() const { return kind_; }
    const std::string& name() const { return name_; }
    int line() const { return line_; }

   private:
    Kind kind_;
    std::string name_;
    int line_;
};

// 同一スコープ内での再宣言
class RedeclarationError : public SymbolError {
   public:
    RedeclarationError(const std::string& name, int line, int first_line);

    int first_line() const { return first_line_; }

   private:
    int first_line_;
};

// 宣言前の使用
class UseBeforeDeclarationError : public SymbolError {
   public:
    UseBeforeDeclarationError(const std::string& name, int line);
};

// ============================================================
// スコープ（フレーム）
// 変数本体はSymbolTableの宣言履歴に置き、ここでは履歴の添字を持つ
// ============================================================
class Scope {
   public:
    explicit Scope(int level) : level_(level) {}

    // シンボル登録（既存ならfalse）
    bool define(const std::string& name, size_t index) {
        return symbols_.emplace(name, index).second;
    }

    // 現スコープのみ検索（見つからなければ-1）
    long find(const std::string& name) const {
        auto it = symbols_.find(name);
        if (it == symbols_.end())
            return -1;
        return static_cast<long>(it->second);
    }

    bool has_local(const std::string& name) const { return symbols_.count(name) > 0; }

    int level() const { return level_; }

    const std::unordered_map<std::string, size_t>& symbols() const { return symbols_; }

   private:
    int level_;
    std::unordered_map<std::string, size_t> symbols_;
};

// ============================================================
// スコープ付きシンボルテーブル
// ============================================================
class SymbolTable {
   public:
    SymbolTable();

    // ============================================================
    // トークン管理
    // ============================================================
    void add_token(const std::string& kind, const std::string& lexeme, int line, int column);
    const std::vector<TokenRecord>& tokens() const { return tokens_; }

    // ============================================================
    // スコープ管理
    // ============================================================
    void enter_scope();

    // グローバルスコープのみの場合は何もしない
    void exit_scope();

    // 現在のスコープ深さ（0 = グローバル）
    int depth() const { return static_cast<int>(scopes_.size()) - 1; }

    // ============================================================
    // 変数管理
    // ============================================================

    // 現スコープに宣言する。同じスコープに同名があればRedeclarationError
    VariableInfo declare(const std::string& name, const std::string& type, int line);

    // 内側から外側へ検索。見つからなければnullptr
    // 返すポインタは次のdeclare/resetまで有効
    const VariableInfo* lookup(const std::string& name) const;

    bool is_declared(const std::string& name) const { return lookup(name) != nullptr; }

    bool exists_in_current_scope(const std::string& name) const {
        return scopes_.back().has_local(name);
    }

    // 使用済みとしてマーク。未宣言ならUseBeforeDeclarationError
    void mark_used(const std::string& name, int line = 0);

    // 現在開いているスコープ内の未使用変数（宣言順）
    // 閉じたスコープの変数は含まない
    std::vector<VariableInfo> unused_variables() const;

    // "name (line N)" 形式の未使用変数一覧
    std::vector<std::string> format_unused() const;

    // 宣言された全変数（閉じたスコープを含む、宣言順）
    const std::vector<VariableInfo>& declared_variables() const { return history_; }

    // ============================================================
    // 表示
    // ============================================================
    void print_tokens(std::ostream& out = std::cout) const;
    void print_variables(std::ostream& out = std::cout) const;

    // 全データをクリアしてグローバルスコープのみに戻す
    void reset();

   private:
    long find_index(const std::string& name) const;

    std::vector<VariableInfo> history_;
    std::vector<Scope> scopes_;
    std::vector<TokenRecord> tokens_;
};

}  // namespace jsema
