#pragma once

// ============================================================
// TypeChecker
// 実装は以下のファイルに分割されています：
// - checking/base.hpp       : 基底定義・設定
// - checking/checker.hpp    : メインクラス定義
// - checking/decl.cpp       : クラス・メソッド・フィールドの走査
// - checking/stmt.cpp       : 文のチェック
// - checking/expr.cpp       : 式の型推論
// - checking/utils.cpp      : 互換性表・診断ユーティリティ
// ============================================================

#include "checking/checker.hpp"
