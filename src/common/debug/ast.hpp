#pragma once

#include "../debug.hpp"

#include <string>

namespace jsema::debug::ast {

enum class Id { NodeCreate, Declaration, Reference, Assignment };

inline const char* messages[][2] = {
    {"Creating AST node", "ASTノードを作成"},
    {"Building declaration", "宣言を構築"},
    {"Building reference", "参照を構築"},
    {"Building assignment", "代入を構築"},
};

inline const char* get(Id id) {
    return messages[static_cast<int>(id)][::jsema::debug::g_lang];
}

inline void log(Id id, ::jsema::debug::Level level = ::jsema::debug::Level::Debug) {
    if (!::jsema::debug::g_debug_mode || level < ::jsema::debug::g_debug_level)
        return;
    ::jsema::debug::log(::jsema::debug::Stage::Ast, level, get(id));
}

inline void log(Id id, const std::string& detail,
                ::jsema::debug::Level level = ::jsema::debug::Level::Debug) {
    if (!::jsema::debug::g_debug_mode || level < ::jsema::debug::g_debug_level)
        return;
    ::jsema::debug::log(::jsema::debug::Stage::Ast, level, std::string(get(id)) + ": " + detail);
}

}  // namespace jsema::debug::ast
