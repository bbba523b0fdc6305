#include "../../src/frontend/builder/ast_builder.hpp"
#include "../../src/frontend/types/type_checker.hpp"

#include <gtest/gtest.h>

using namespace jsema;

class AstBuilderTest : public ::testing::Test {
   protected:
    SymbolTable table;
    AstBuilder builder{table};
};

// ============================================================
// 構築時の型記録
// ============================================================
TEST_F(AstBuilderTest, ReferenceRecordsDeclaredType) {
    builder.declare_variable("double", "rate", nullptr, 1);
    auto ref = builder.reference("rate", 2);

    auto* ident = ref->as<ast::IdentExpr>();
    ASSERT_NE(ident, nullptr);
    EXPECT_EQ(ident->name, "rate");
    EXPECT_EQ(ident->resolved_type, "double");
    EXPECT_EQ(ref->line, 2);
    EXPECT_TRUE(table.lookup("rate")->used);
}

TEST_F(AstBuilderTest, ReferenceSeesInnermostDeclaration) {
    builder.declare_variable("int", "v", nullptr, 1);
    builder.begin_scope();
    builder.declare_variable("String", "v", nullptr, 2);
    auto inner = builder.reference("v", 3);
    builder.end_scope();
    auto outer = builder.reference("v", 4);

    EXPECT_EQ(inner->as<ast::IdentExpr>()->resolved_type, "String");
    EXPECT_EQ(outer->as<ast::IdentExpr>()->resolved_type, "int");
}

TEST_F(AstBuilderTest, AssignRecordsTargetType) {
    builder.declare_variable("long", "big", nullptr, 1);
    auto stmt = builder.assign("big", ast::make_int_literal(7, 2), 2);

    auto* assign = stmt->as<ast::AssignStmt>();
    ASSERT_NE(assign, nullptr);
    EXPECT_EQ(assign->target, "big");
    EXPECT_EQ(assign->target_type, "long");
    EXPECT_TRUE(table.lookup("big")->used);
}

TEST_F(AstBuilderTest, DeclarationsProduceNodes) {
    auto field = builder.declare_field("int", "total", ast::make_int_literal(0, 1), 1);
    auto* f = field->as<ast::FieldDecl>();
    ASSERT_NE(f, nullptr);
    EXPECT_EQ(f->type, "int");
    EXPECT_EQ(f->name, "total");

    builder.begin_scope();
    auto param = builder.declare_parameter("String", "name", 2);
    EXPECT_EQ(param.name, "name");
    EXPECT_EQ(param.type, "String");
    EXPECT_EQ(builder.depth(), 1);

    auto var = builder.declare_variable("char", "c", ast::make_char_literal('a', 3), 3);
    auto* decl = var->as<ast::VarDeclStmt>();
    ASSERT_NE(decl, nullptr);
    EXPECT_EQ(decl->name, "c");
    ASSERT_NE(decl->init, nullptr);
    EXPECT_EQ(table.lookup("c")->scope_level, 1);
}

// ============================================================
// 致命的エラーは呼び出し元に伝播する
// ============================================================
TEST_F(AstBuilderTest, RedeclarationPropagates) {
    builder.declare_variable("int", "x", nullptr, 1);
    EXPECT_THROW(builder.declare_variable("int", "x", nullptr, 2), RedeclarationError);
}

TEST_F(AstBuilderTest, ParameterRedeclaredAsLocalPropagates) {
    builder.begin_scope();
    builder.declare_parameter("int", "n", 1);
    EXPECT_THROW(builder.declare_variable("int", "n", nullptr, 2), RedeclarationError);
}

TEST_F(AstBuilderTest, UndeclaredReferencePropagates) {
    EXPECT_THROW(builder.reference("ghost", 3), UseBeforeDeclarationError);
    EXPECT_THROW(builder.assign("ghost", ast::make_int_literal(1), 4), UseBeforeDeclarationError);
}

TEST_F(AstBuilderTest, ReferenceAfterScopeClosedPropagates) {
    builder.begin_scope();
    builder.declare_variable("int", "tmp", nullptr, 1);
    builder.end_scope();
    try {
        builder.reference("tmp", 3);
        FAIL() << "expected UseBeforeDeclarationError";
    } catch (const UseBeforeDeclarationError& e) {
        EXPECT_EQ(std::string(e.what()), "Line 3: Variable 'tmp' used before declaration");
    }
}

TEST_F(AstBuilderTest, RecordTokenStoresToken) {
    builder.record_token("IDENTIFIER", "main", 1, 12);
    ASSERT_EQ(table.tokens().size(), 1u);
    EXPECT_EQ(table.tokens()[0].lexeme, "main");
    EXPECT_EQ(table.tokens()[0].column, 12);
}

// ============================================================
// 構築後の型チェック
// ============================================================
TEST_F(AstBuilderTest, LocalMismatchDetectedAfterScopesClose) {
    // class Main {
    //     int total = 0;
    //     void run(int n) {
    //         int x = n;
    //         { boolean done = x; }
    //         x = "s";
    //     }
    // }
    std::vector<ast::DeclPtr> members;
    members.push_back(builder.declare_field("int", "total", ast::make_int_literal(0, 2), 2));

    builder.begin_scope();
    std::vector<ast::Param> params;
    params.push_back(builder.declare_parameter("int", "n", 3));

    std::vector<ast::StmtPtr> body;
    body.push_back(builder.declare_variable("int", "x", builder.reference("n", 4), 4));

    builder.begin_scope();
    std::vector<ast::StmtPtr> inner;
    inner.push_back(builder.declare_variable("boolean", "done", builder.reference("x", 5), 5));
    builder.end_scope();
    body.push_back(ast::make_block(std::move(inner), 5));

    body.push_back(builder.assign("x", ast::make_string_literal("s", 6), 6));
    builder.end_scope();

    members.push_back(ast::make_method("run", "void", std::move(params), std::move(body), 3));
    ast::Program program("Main.java");
    program.classes.push_back(ast::make_class("Main", std::move(members), 1));

    ASSERT_EQ(builder.depth(), 0);
    ASSERT_EQ(table.lookup("x"), nullptr);

    TypeChecker checker(table);
    checker.analyze(program);

    auto errors = checker.errors();
    ASSERT_EQ(errors.size(), 2u);
    EXPECT_EQ(errors[0],
              "Line 5: Type mismatch in initialization of 'done': cannot assign int to boolean");
    EXPECT_EQ(errors[1], "Line 6: Type mismatch: cannot assign String to int in variable 'x'");
    EXPECT_TRUE(checker.warnings().empty());

    // 閉じたスコープの未使用変数は報告しない
    auto unused = table.format_unused();
    ASSERT_EQ(unused.size(), 1u);
    EXPECT_EQ(unused[0], "total (line 2)");

    EXPECT_EQ(table.declared_variables().size(), 4u);
}
