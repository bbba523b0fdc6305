#pragma once

// ============================================================
// TypeChecker 基底定義
// 共通のインクルードと設定
// ============================================================

#include "../../../common/debug/tc.hpp"
#include "../../../common/diagnostics.hpp"
#include "../../ast/decl.hpp"
#include "../scope.hpp"

#include <string>
#include <vector>

namespace jsema {

// 型チェッカー設定
struct CheckerConfig {
    // trueなら算術演算子でのString許可を '+' に限定する
    // falseでは + - * / % のすべてでStringを許可する（従来動作）
    bool strict_string_arithmetic = false;
};

// TypeCheckerの前方宣言
class TypeChecker;

}  // namespace jsema
