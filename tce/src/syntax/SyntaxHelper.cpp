#include "syntax/SyntaxHelper.h"
#include "common/Exceptions.h"
#include "syntax/TreeEditor.h"

namespace TCE::SyntaxHelper {

namespace {

int binaryOperatorPrecedence(const std::string &op) {
    if (op == "|") {
        return PRECEDENCE_BIT_OR;
    }
    if (op == "^") {
        return PRECEDENCE_BIT_XOR;
    }
    if (op == "&") {
        return PRECEDENCE_BIT_AND;
    }
    if (op == "<<" || op == ">>") {
        return PRECEDENCE_SHIFT;
    }
    if (op == "+" || op == "-") {
        return PRECEDENCE_ARITH;
    }
    if (op == "**") {
        return PRECEDENCE_POWER;
    }
    return PRECEDENCE_TERM;
}

bool isBlockStructure(const NodePtr &child) {
    if (!child->isToken()) {
        return false;
    }
    TokenKind kind = child->getToken().kind;
    return kind == TokenKind::Newline || kind == TokenKind::Indent || kind == TokenKind::Dedent;
}

bool startsWithAny(const std::string &name, const std::vector<std::string> &prefixes) {
    for (const auto &prefix : prefixes) {
        if (name.compare(0, prefix.size(), prefix) == 0) {
            return true;
        }
    }
    return false;
}

}  // namespace

int precedenceOf(const NodePtr &expression) {
    switch (expression->getKind()) {
    case SyntaxKind::Lambda:
        return PRECEDENCE_LAMBDA;
    case SyntaxKind::IfExp:
        return PRECEDENCE_IF_EXP;
    case SyntaxKind::BoolOp:
        return expression->findTokenIndex("or") != std::string::npos ? PRECEDENCE_OR : PRECEDENCE_AND;
    case SyntaxKind::UnaryOp:
        return expression->getChild(0)->isToken("not") ? PRECEDENCE_NOT : PRECEDENCE_UNARY;
    case SyntaxKind::Comparison:
        return PRECEDENCE_COMPARISON;
    case SyntaxKind::BinaryOp:
        return binaryOperatorPrecedence(expression->getChild(1)->getToken().text);
    case SyntaxKind::Await:
        return PRECEDENCE_AWAIT;
    case SyntaxKind::Tuple:
        return expression->getChild(0)->isToken("(") ? PRECEDENCE_ATOM : PRECEDENCE_LOWEST;
    case SyntaxKind::NamedExpr:
    case SyntaxKind::Starred:
    case SyntaxKind::Yield:
        return PRECEDENCE_LOWEST;
    default:
        return PRECEDENCE_ATOM;
    }
}

std::string operandText(const NodePtr &expression, int minPrecedence) {
    std::string text = expression->getSourceText();
    if (precedenceOf(expression) < minPrecedence) {
        return "(" + text + ")";
    }
    return text;
}

NodeList statementsOf(const NodePtr &block) {
    NodeList statements;
    if (!block) {
        return statements;
    }
    for (const auto &child : block->getChildren()) {
        if (!isBlockStructure(child)) {
            statements.push_back(child);
        }
    }
    return statements;
}

NodePtr withStatements(const NodePtr &block, NodeList statements) {
    if (statements.empty()) {
        throw RewriteError("a block needs at least one statement");
    }
    const NodeList &children = block->getChildren();
    bool indented = !children.empty() && children.front()->isToken() &&
                    children.front()->getToken().kind == TokenKind::Newline;
    if (!indented) {
        if (statements.size() != 1) {
            throw RewriteError("cannot expand an inline suite");
        }
        return TreeEditor::withChildren(block, std::move(statements));
    }

    NodeList rebuilt{children[0], children[1]};
    for (auto &statement : statements) {
        rebuilt.push_back(std::move(statement));
    }
    rebuilt.push_back(children.back());
    return TreeEditor::withChildren(block, std::move(rebuilt));
}

size_t bodyIndexOf(const NodePtr &compound) {
    const NodeList &children = compound->getChildren();
    for (size_t i = 0; i < children.size(); ++i) {
        if (children[i]->is(SyntaxKind::Block)) {
            return i;
        }
    }
    return std::string::npos;
}

NodePtr bodyOf(const NodePtr &compound) {
    size_t index = bodyIndexOf(compound);
    return index == std::string::npos ? nullptr : compound->getChild(index);
}

std::string definitionName(const NodePtr &definition) {
    const char *keyword = definition->is(SyntaxKind::ClassDef) ? "class" : "def";
    size_t index = definition->findTokenIndex(keyword);
    if (index == std::string::npos || index + 1 >= definition->getChildCount()) {
        return "";
    }
    return definition->getChild(index + 1)->getToken().text;
}

NodeList decoratorsOf(const NodePtr &definition) {
    NodeList decorators;
    for (const auto &child : definition->getChildren()) {
        if (!child->is(SyntaxKind::Decorator)) {
            break;
        }
        decorators.push_back(child);
    }
    return decorators;
}

std::vector<std::string> parameterNames(const NodePtr &function) {
    std::vector<std::string> names;
    NodePtr parameters = function->findChild(SyntaxKind::Parameters);
    if (!parameters) {
        return names;
    }
    for (const auto &param : parameters->getNodeChildren()) {
        for (const auto &child : param->getChildren()) {
            if (child->isToken() && child->getToken().kind == TokenKind::Name) {
                names.push_back(child->getToken().text);
                break;
            }
        }
    }
    return names;
}

bool isAsync(const NodePtr &compound) {
    for (const auto &child : compound->getChildren()) {
        if (!child->is(SyntaxKind::Decorator)) {
            return child->isToken("async");
        }
    }
    return false;
}

std::string dottedName(const NodePtr &expression) {
    if (expression->is(SyntaxKind::Name)) {
        return expression->getChild(0)->getToken().text;
    }
    if (expression->is(SyntaxKind::Attribute)) {
        std::string base = dottedName(expression->getChild(0));
        if (base.empty()) {
            return "";
        }
        return base + "." + expression->getChild(2)->getToken().text;
    }
    return "";
}

std::optional<std::string> selfMethodName(const NodePtr &call) {
    if (!call || !call->is(SyntaxKind::Call)) {
        return std::nullopt;
    }
    const NodePtr &callee = call->getChild(0);
    if (!callee->is(SyntaxKind::Attribute) || dottedName(callee->getChild(0)) != "self") {
        return std::nullopt;
    }
    return callee->getChild(2)->getToken().text;
}

NodePtr expressionOfStatement(const NodePtr &statement) {
    if (!statement->is(SyntaxKind::SimpleStatement) || statement->getChildCount() != 2) {
        return nullptr;
    }
    const NodePtr &small = statement->getChild(0);
    if (!small->is(SyntaxKind::ExprStatement)) {
        return nullptr;
    }
    return small->getChild(0);
}

std::vector<CallArgument> argumentsOf(const NodePtr &call) {
    std::vector<CallArgument> arguments;
    NodePtr argumentList = call->findChild(SyntaxKind::ArgumentList);
    if (!argumentList) {
        return arguments;
    }
    for (const auto &argument : argumentList->getNodeChildren()) {
        CallArgument entry;
        entry.argument = argument;
        const NodePtr &first = argument->getChild(0);
        if (first->isToken("*")) {
            entry.kind = CallArgument::Kind::Star;
            entry.value = argument->getChild(1);
        } else if (first->isToken("**")) {
            entry.kind = CallArgument::Kind::DoubleStar;
            entry.value = argument->getChild(1);
        } else if (argument->getChildCount() == 3 && argument->getChild(1)->isToken("=")) {
            entry.kind = CallArgument::Kind::Keyword;
            entry.keyword = first->getToken().text;
            entry.value = argument->getChild(2);
        } else if (argument->getChildCount() > 1) {
            entry.kind = CallArgument::Kind::Generator;
        } else {
            entry.value = first;
        }
        arguments.push_back(std::move(entry));
    }
    return arguments;
}

bool isLiteral(const NodePtr &expression) {
    switch (expression->getKind()) {
    case SyntaxKind::Literal:
        return true;
    case SyntaxKind::String:
        for (const auto &token : expression->getChildren()) {
            const std::string &text = token->getToken().text;
            size_t quote = text.find_first_of("'\"");
            std::string prefix = text.substr(0, quote);
            if (prefix.find_first_of("fFtT") != std::string::npos) {
                return false;
            }
        }
        return true;
    case SyntaxKind::Name: {
        const std::string &name = expression->getChild(0)->getToken().text;
        return name == "None" || name == "True" || name == "False";
    }
    case SyntaxKind::UnaryOp:
        return (expression->getChild(0)->isToken("-") || expression->getChild(0)->isToken("+")) &&
               expression->getChild(1)->is(SyntaxKind::Literal);
    case SyntaxKind::Paren:
    case SyntaxKind::Tuple:
    case SyntaxKind::List:
    case SyntaxKind::Set:
    case SyntaxKind::Dict:
        for (const auto &child : expression->getNodeChildren()) {
            if (child->is(SyntaxKind::DictItem)) {
                if (child->getChildCount() != 3 || !isLiteral(child->getChild(0)) || !isLiteral(child->getChild(2))) {
                    return false;
                }
            } else if (!isLiteral(child)) {
                return false;
            }
        }
        return true;
    default:
        return false;
    }
}

void collectNames(const NodePtr &node, std::set<std::string> &names) {
    if (node->is(SyntaxKind::Name)) {
        names.insert(node->getChild(0)->getToken().text);
        return;
    }
    for (const auto &child : node->getChildren()) {
        if (!child->isToken()) {
            collectNames(child, names);
        }
    }
}

bool referencesName(const NodePtr &node, const std::string &name) {
    std::set<std::string> names;
    collectNames(node, names);
    return names.count(name) > 0;
}

void collectTargetNames(const NodePtr &target, std::set<std::string> &names) {
    switch (target->getKind()) {
    case SyntaxKind::Name:
        names.insert(target->getChild(0)->getToken().text);
        break;
    case SyntaxKind::Tuple:
    case SyntaxKind::List:
    case SyntaxKind::Paren:
    case SyntaxKind::Starred:
        for (const auto &child : target->getNodeChildren()) {
            collectTargetNames(child, names);
        }
        break;
    default:
        break;
    }
}

bool containsSelfCall(const NodePtr &node, const std::vector<std::string> &methodPrefixes) {
    if (node->is(SyntaxKind::Call)) {
        auto method = selfMethodName(node);
        if (method && startsWithAny(*method, methodPrefixes)) {
            return true;
        }
    }
    for (const auto &child : node->getChildren()) {
        if (!child->isToken() && containsSelfCall(child, methodPrefixes)) {
            return true;
        }
    }
    return false;
}

}  // namespace TCE::SyntaxHelper
