#include "syntax/SyntaxFactory.h"
#include "common/Exceptions.h"
#include "syntax/Parser.h"
#include "syntax/TreeEditor.h"
#include <format>

namespace TCE {

NodePtr SyntaxFactory::parseExpression(const std::string &text) {
    Parser parser(text);
    return TreeEditor::detach(parser.parseExpressionOnly());
}

NodeList SyntaxFactory::parseStatements(const std::string &text, const std::string &indent) {
    NodePtr module = Parser::parse(text);
    NodeList statements;
    for (const auto &child : module->getChildren()) {
        if (child->isToken()) {
            continue;
        }
        statements.push_back(TreeEditor::reindent(TreeEditor::detach(child), "", indent));
    }
    return statements;
}

NodePtr SyntaxFactory::parseStatement(const std::string &text, const std::string &indent) {
    NodeList statements = parseStatements(text, indent);
    if (statements.size() != 1) {
        throw RewriteError(std::format("expected one statement, got {}", statements.size()));
    }
    return statements.front();
}

NodePtr SyntaxFactory::parseSmallStatement(const std::string &text) {
    NodePtr statement = parseStatement(text + "\n", "");
    if (!statement->is(SyntaxKind::SimpleStatement) || statement->getChildCount() != 2) {
        throw RewriteError("expected a single small statement: " + text);
    }
    return statement->getChild(0);
}

NodePtr SyntaxFactory::makeDecorator(const std::string &expression, const std::string &indent) {
    NodePtr function = parseStatement("@" + expression + "\ndef _():\n    pass\n", indent);
    NodePtr decorator = function->findChild(SyntaxKind::Decorator);
    if (!decorator) {
        throw RewriteError("invalid decorator expression: " + expression);
    }
    return decorator;
}

NodePtr SyntaxFactory::makeParam(const std::string &name, const std::string &annotation) {
    std::string param = annotation.empty() ? name : name + ": " + annotation;
    NodePtr function = parseStatement("def _(" + param + "):\n    pass\n", "");
    NodePtr parameters = function->findChild(SyntaxKind::Parameters);
    NodePtr result = parameters ? parameters->findChild(SyntaxKind::Param) : nullptr;
    if (!result) {
        throw RewriteError("invalid parameter: " + param);
    }
    return result;
}

NodePtr SyntaxFactory::makeToken(TokenKind kind, const std::string &text, const std::string &trivia) {
    Token token;
    token.kind = kind;
    token.text = text;
    token.leadingTrivia = trivia;
    return SyntaxNode::createToken(std::move(token));
}

void SyntaxFactory::checkParses(const NodePtr &statement) {
    NodePtr shifted = TreeEditor::reindent(statement, TreeEditor::indentationOf(statement), "");
    std::string text = shifted->render();
    if (text.empty() || (text.back() != '\n' && text.back() != '\r')) {
        text += '\n';
    }
    Parser::parse(text);
}

}  // namespace TCE
