#pragma once

// デバッグメッセージ統合ヘッダ
// 各ステージのメッセージを一括インクルード

#include "debug/ast.hpp"
#include "debug/sym.hpp"
#include "debug/tc.hpp"

// 使用例:
// debug::sym::log(debug::sym::Id::ScopeEnter, "depth 1");
// debug::tc::log(debug::tc::Id::TypeInfer, "x : int", debug::Level::Trace);
