#pragma once

#include "../debug.hpp"

#include <string>

namespace jsema::debug::sym {

enum class Id {
    ScopeEnter,
    ScopeExit,
    ScopeExitIgnored,
    Declare,
    Redeclare,
    MarkUsed,
    Undeclared,
    Token,
    Reset
};

inline const char* messages[][2] = {
    {"Entering scope", "スコープに入る"},
    {"Exiting scope", "スコープを出る"},
    {"Exit ignored at global scope", "グローバルスコープでの退出を無視"},
    {"Declared variable", "変数を宣言"},
    {"Redeclaration", "再宣言"},
    {"Marked as used", "使用済みとしてマーク"},
    {"Undeclared variable", "未宣言の変数"},
    {"Recorded token", "トークンを記録"},
    {"Symbol table reset", "シンボルテーブルをリセット"},
};

inline const char* get(Id id) {
    return messages[static_cast<int>(id)][::jsema::debug::g_lang];
}

inline void log(Id id, ::jsema::debug::Level level = ::jsema::debug::Level::Debug) {
    if (!::jsema::debug::g_debug_mode || level < ::jsema::debug::g_debug_level)
        return;
    ::jsema::debug::log(::jsema::debug::Stage::Symbols, level, get(id));
}

inline void log(Id id, const std::string& detail,
                ::jsema::debug::Level level = ::jsema::debug::Level::Debug) {
    if (!::jsema::debug::g_debug_mode || level < ::jsema::debug::g_debug_level)
        return;
    ::jsema::debug::log(::jsema::debug::Stage::Symbols, level,
                        std::string(get(id)) + ": " + detail);
}

}  // namespace jsema::debug::sym
