#pragma once

#include <iostream>
#include <string>
#include <vector>

namespace jsema {

/// 診断メッセージの重大度
enum class Severity {
    Error,
    Warning,
};

/// 単一の診断メッセージ
struct Diagnostic {
    Severity severity;
    int line;  // 0なら行情報なし
    std::string message;

    Diagnostic(Severity sev, int ln, std::string msg)
        : severity(sev), line(ln), message(std::move(msg)) {}

    /// "Line N: message" 形式に整形
    std::string to_string() const;
};

/// 診断メッセージを収集・表示するクラス
class Diagnostics {
   public:
    Diagnostics() : error_count_(0), warning_count_(0) {}

    /// エラーを追加
    void error(int line, const std::string& message) {
        diagnostics_.emplace_back(Severity::Error, line, message);
        ++error_count_;
    }

    /// 警告を追加
    void warning(int line, const std::string& message) {
        diagnostics_.emplace_back(Severity::Warning, line, message);
        ++warning_count_;
    }

    /// エラーがあるか
    bool has_errors() const { return error_count_ > 0; }

    /// エラー数を取得
    size_t error_count() const { return error_count_; }

    /// 警告数を取得
    size_t warning_count() const { return warning_count_; }

    /// 全ての診断（報告順）
    const std::vector<Diagnostic>& all() const { return diagnostics_; }

    /// 指定した重大度のメッセージを整形済み文字列で取得
    std::vector<std::string> messages(Severity severity) const;

    /// 全ての診断メッセージを表示
    void print(std::ostream& out = std::cerr) const;

    /// 診断メッセージをクリア
    void clear() {
        diagnostics_.clear();
        error_count_ = 0;
        warning_count_ = 0;
    }

   private:
    std::vector<Diagnostic> diagnostics_;
    size_t error_count_;
    size_t warning_count_;
};

}  // namespace jsema
