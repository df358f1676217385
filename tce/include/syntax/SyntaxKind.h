#pragma once

#include <string>

namespace TCE {

/**
 * @brief Tag of a SyntaxNode
 *
 * Token is the leaf kind. Statement kinds follow Python's grammar closely
 * enough for the rewriters to match on structure; anything the rewriters do
 * not need to look into (match statements) is kept as GenericCompound.
 */
enum class SyntaxKind {
    Token,

    // Structure
    Module,
    Block,
    SimpleStatement,

    // Simple statements
    ExprStatement,
    Assign,
    AugAssign,
    AnnAssign,
    Assert,
    Import,
    ImportFrom,
    ImportAlias,
    DottedName,
    KeywordStatement,

    // Compound statements
    If,
    ElifClause,
    ElseClause,
    For,
    While,
    With,
    WithItem,
    Try,
    ExceptClause,
    FinallyClause,
    FunctionDef,
    ClassDef,
    Decorator,
    Parameters,
    Param,
    GenericCompound,

    // Expressions
    Name,
    Literal,
    String,
    Paren,
    Tuple,
    List,
    Set,
    Dict,
    DictItem,
    ListComp,
    SetComp,
    DictComp,
    GeneratorExp,
    CompFor,
    CompIf,
    Attribute,
    Call,
    ArgumentList,
    Argument,
    Subscript,
    Slice,
    Comparison,
    BoolOp,
    UnaryOp,
    BinaryOp,
    IfExp,
    Lambda,
    NamedExpr,
    Starred,
    Await,
    Yield
};

std::string syntaxKindToString(SyntaxKind kind);

bool isStatementKind(SyntaxKind kind);
bool isCompoundStatementKind(SyntaxKind kind);
bool isExpressionKind(SyntaxKind kind);

}  // namespace TCE
