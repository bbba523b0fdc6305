// スコープ管理の実装
#include "scope.hpp"

#include "../../common/debug/sym.hpp"

#include <algorithm>
#include <fmt/format.h>

namespace jsema {

namespace {

std::string with_line(int line, const std::string& message) {
    if (line <= 0)
        return message;
    return fmt::format("Line {}: {}", line, message);
}

}  // namespace

RedeclarationError::RedeclarationError(const std::string& name, int line, int first_line)
    : SymbolError(Kind::Redeclaration, name, line,
                  with_line(line, fmt::format("Variable '{}' is already declared in this scope "
                                              "(first declared at line {})",
                                              name, first_line))),
      first_line_(first_line) {}

UseBeforeDeclarationError::UseBeforeDeclarationError(const std::string& name, int line)
    : SymbolError(Kind::UseBeforeDeclaration, name, line,
                  with_line(line, fmt::format("Variable '{}' used before declaration", name))) {}

SymbolTable::SymbolTable() {
    scopes_.emplace_back(0);  // グローバルスコープ
}

// トークン記録
void SymbolTable::add_token(const std::string& kind, const std::string& lexeme, int line,
                            int column) {
    tokens_.push_back(TokenRecord{kind, lexeme, line, column});
    debug::sym::log(debug::sym::Id::Token,
                    fmt::format("{} '{}' at {}:{}", kind, lexeme, line, column),
                    debug::Level::Trace);
}

// スコープ: push
void SymbolTable::enter_scope() {
    scopes_.emplace_back(static_cast<int>(scopes_.size()));
    debug::sym::log(debug::sym::Id::ScopeEnter, fmt::format("depth {}", depth()),
                    debug::Level::Trace);
}

// スコープ: pop
void SymbolTable::exit_scope() {
    if (scopes_.size() > 1) {
        scopes_.pop_back();
        debug::sym::log(debug::sym::Id::ScopeExit, fmt::format("depth {}", depth()),
                        debug::Level::Trace);
    } else {
        debug::sym::log(debug::sym::Id::ScopeExitIgnored, debug::Level::Warn);
    }
}

VariableInfo SymbolTable::declare(const std::string& name, const std::string& type,
                                  int line) {
    auto& current = scopes_.back();
    long existing = current.find(name);
    if (existing >= 0) {
        debug::sym::log(debug::sym::Id::Redeclare, name, debug::Level::Error);
        throw RedeclarationError(name, line, history_[static_cast<size_t>(existing)].line);
    }

    size_t index = history_.size();
    history_.push_back(VariableInfo{name, type, line, false, current.level()});
    current.define(name, index);

    debug::sym::log(debug::sym::Id::Declare,
                    fmt::format("{} : {} (line {}, depth {})", name, type, line, current.level()));
    return history_[index];
}

long SymbolTable::find_index(const std::string& name) const {
    for (auto it = scopes_.rbegin(); it != scopes_.rend(); ++it) {
        long index = it->find(name);
        if (index >= 0) {
            return index;
        }
    }
    return -1;
}

const VariableInfo* SymbolTable::lookup(const std::string& name) const {
    long index = find_index(name);
    if (index < 0)
        return nullptr;
    return &history_[static_cast<size_t>(index)];
}

void SymbolTable::mark_used(const std::string& name, int line) {
    long index = find_index(name);
    if (index < 0) {
        debug::sym::log(debug::sym::Id::Undeclared, name, debug::Level::Error);
        throw UseBeforeDeclarationError(name, line);
    }
    history_[static_cast<size_t>(index)].used = true;
    debug::sym::log(debug::sym::Id::MarkUsed, name, debug::Level::Trace);
}

std::vector<VariableInfo> SymbolTable::unused_variables() const {
    std::vector<size_t> indices;
    for (const auto& scope : scopes_) {
        for (const auto& [name, index] : scope.symbols()) {
            if (!history_[index].used) {
                indices.push_back(index);
            }
        }
    }
    std::sort(indices.begin(), indices.end());

    std::vector<VariableInfo> unused;
    unused.reserve(indices.size());
    for (auto index : indices) {
        unused.push_back(history_[index]);
    }
    return unused;
}

std::vector<std::string> SymbolTable::format_unused() const {
    std::vector<std::string> result;
    for (const auto& info : unused_variables()) {
        result.push_back(fmt::format("{} (line {})", info.name, info.line));
    }
    return result;
}

void SymbolTable::print_tokens(std::ostream& out) const {
    const std::string rule = "+------+---------------------+--------------+------+--------+\n";
    out << rule;
    out << "| No.  | Token Type          | Lexeme       | Line | Column |\n";
    out << rule;
    int count = 1;
    for (const auto& entry : tokens_) {
        out << fmt::format("| {:<4} | {:<19} | {:<12} | {:>4} | {:>6} |\n", count++, entry.kind,
                           entry.lexeme, entry.line, entry.column);
    }
    out << rule;
}

void SymbolTable::print_variables(std::ostream& out) const {
    const std::string rule = "+-----------------+----------+------+------+-------+\n";
    out << rule;
    out << "| Variable Name   | Type     | Line | Used | Scope |\n";
    out << rule;
    for (const auto& info : history_) {
        out << fmt::format("| {:<15} | {:<8} | {:>4} | {:<4} | {:>5} |\n", info.name, info.type,
                           info.line, info.used ? "Yes" : "No", info.scope_level);
    }
    out << rule;
}

void SymbolTable::reset() {
    tokens_.clear();
    history_.clear();
    scopes_.clear();
    scopes_.emplace_back(0);
    debug::sym::log(debug::sym::Id::Reset);
}

}  // namespace jsema
