#pragma once

#include "../debug.hpp"

#include <string>

namespace jsema::debug::tc {

enum class Id { Start, End, CheckExpr, CheckStmt, CheckDecl, TypeInfer, TypeError, TypeWarning, Resolved, NodeFailed };

inline const char* messages[][2] = {
    {"Starting type check", "型チェックを開始"},
    {"Completed type check", "型チェックを完了"},
    {"Checking expression", "式を検査"},
    {"Checking statement", "文を検査"},
    {"Checking declaration", "宣言を検査"},
    {"Type inferred", "型を推論"},
    {"Type error", "型エラー"},
    {"Type warning", "型警告"},
    {"Type resolved", "型を解決"},
    {"Node analysis failed", "ノードの解析に失敗"},
};

inline const char* get(Id id) {
    return messages[static_cast<int>(id)][::jsema::debug::g_lang];
}

inline void log(Id id, ::jsema::debug::Level level = ::jsema::debug::Level::Debug) {
    if (!::jsema::debug::g_debug_mode || level < ::jsema::debug::g_debug_level)
        return;
    ::jsema::debug::log(::jsema::debug::Stage::TypeCheck, level, get(id));
}

inline void log(Id id, const std::string& detail,
                ::jsema::debug::Level level = ::jsema::debug::Level::Debug) {
    if (!::jsema::debug::g_debug_mode || level < ::jsema::debug::g_debug_level)
        return;
    ::jsema::debug::log(::jsema::debug::Stage::TypeCheck, level,
                        std::string(get(id)) + ": " + detail);
}

}  // namespace jsema::debug::tc
