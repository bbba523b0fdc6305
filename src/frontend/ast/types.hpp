#pragma once

#include <string>

namespace jsema::ast {

// ============================================================
// 型の種類
// 型は宣言・リテラルに書かれた名前（"int", "String", "Scanner" 等）で扱う。
// TypeKind は組み込み型の分類にのみ使う。
// ============================================================
enum class TypeKind {
    // プリミティブ型
    Byte,
    Short,
    Char,
    Int,
    Long,
    Float,
    Double,
    Boolean,

    // 組み込み参照型
    String,

    // ユーザー定義型・配列など（名前の一致でのみ互換）
    Other,

    // 解決できない型
    Unknown,
};

/// 型が決定できなかったことを表す名前
inline const std::string UNKNOWN_TYPE = "unknown";

/// 型名を分類
inline TypeKind type_kind(const std::string& name) {
    if (name == "byte")
        return TypeKind::Byte;
    if (name == "short")
        return TypeKind::Short;
    if (name == "char")
        return TypeKind::Char;
    if (name == "int")
        return TypeKind::Int;
    if (name == "long")
        return TypeKind::Long;
    if (name == "float")
        return TypeKind::Float;
    if (name == "double")
        return TypeKind::Double;
    if (name == "boolean")
        return TypeKind::Boolean;
    if (name == "String")
        return TypeKind::String;
    if (name.empty() || name == UNKNOWN_TYPE)
        return TypeKind::Unknown;
    return TypeKind::Other;
}

inline const char* type_kind_str(TypeKind kind) {
    switch (kind) {
        case TypeKind::Byte:
            return "byte";
        case TypeKind::Short:
            return "short";
        case TypeKind::Char:
            return "char";
        case TypeKind::Int:
            return "int";
        case TypeKind::Long:
            return "long";
        case TypeKind::Float:
            return "float";
        case TypeKind::Double:
            return "double";
        case TypeKind::Boolean:
            return "boolean";
        case TypeKind::String:
            return "String";
        case TypeKind::Other:
            return "other";
        case TypeKind::Unknown:
            return "unknown";
    }
    return "unknown";
}

/// 数値型か（charを含む）
inline bool is_numeric(TypeKind kind) {
    switch (kind) {
        case TypeKind::Byte:
        case TypeKind::Short:
        case TypeKind::Char:
        case TypeKind::Int:
        case TypeKind::Long:
        case TypeKind::Float:
        case TypeKind::Double:
            return true;
        default:
            return false;
    }
}

inline bool is_numeric(const std::string& name) {
    return is_numeric(type_kind(name));
}

inline bool is_unknown(const std::string& name) {
    return type_kind(name) == TypeKind::Unknown;
}

// 数値昇格の順序: byte < short < char < int < long < float < double
// 順序外の型は -1
inline int promotion_rank(TypeKind kind) {
    switch (kind) {
        case TypeKind::Byte:
            return 0;
        case TypeKind::Short:
            return 1;
        case TypeKind::Char:
            return 2;
        case TypeKind::Int:
            return 3;
        case TypeKind::Long:
            return 4;
        case TypeKind::Float:
            return 5;
        case TypeKind::Double:
            return 6;
        default:
            return -1;
    }
}

}  // namespace jsema::ast
