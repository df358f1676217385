#include "syntax/SyntaxNode.h"
#include "common/Exceptions.h"

namespace TCE {

std::string syntaxKindToString(SyntaxKind kind) {
    switch (kind) {
    case SyntaxKind::Token:
        return "Token";
    case SyntaxKind::Module:
        return "Module";
    case SyntaxKind::Block:
        return "Block";
    case SyntaxKind::SimpleStatement:
        return "SimpleStatement";
    case SyntaxKind::ExprStatement:
        return "ExprStatement";
    case SyntaxKind::Assign:
        return "Assign";
    case SyntaxKind::AugAssign:
        return "AugAssign";
    case SyntaxKind::AnnAssign:
        return "AnnAssign";
    case SyntaxKind::Assert:
        return "Assert";
    case SyntaxKind::Import:
        return "Import";
    case SyntaxKind::ImportFrom:
        return "ImportFrom";
    case SyntaxKind::ImportAlias:
        return "ImportAlias";
    case SyntaxKind::DottedName:
        return "DottedName";
    case SyntaxKind::KeywordStatement:
        return "KeywordStatement";
    case SyntaxKind::If:
        return "If";
    case SyntaxKind::ElifClause:
        return "ElifClause";
    case SyntaxKind::ElseClause:
        return "ElseClause";
    case SyntaxKind::For:
        return "For";
    case SyntaxKind::While:
        return "While";
    case SyntaxKind::With:
        return "With";
    case SyntaxKind::WithItem:
        return "WithItem";
    case SyntaxKind::Try:
        return "Try";
    case SyntaxKind::ExceptClause:
        return "ExceptClause";
    case SyntaxKind::FinallyClause:
        return "FinallyClause";
    case SyntaxKind::FunctionDef:
        return "FunctionDef";
    case SyntaxKind::ClassDef:
        return "ClassDef";
    case SyntaxKind::Decorator:
        return "Decorator";
    case SyntaxKind::Parameters:
        return "Parameters";
    case SyntaxKind::Param:
        return "Param";
    case SyntaxKind::GenericCompound:
        return "GenericCompound";
    case SyntaxKind::Name:
        return "Name";
    case SyntaxKind::Literal:
        return "Literal";
    case SyntaxKind::String:
        return "String";
    case SyntaxKind::Paren:
        return "Paren";
    case SyntaxKind::Tuple:
        return "Tuple";
    case SyntaxKind::List:
        return "List";
    case SyntaxKind::Set:
        return "Set";
    case SyntaxKind::Dict:
        return "Dict";
    case SyntaxKind::DictItem:
        return "DictItem";
    case SyntaxKind::ListComp:
        return "ListComp";
    case SyntaxKind::SetComp:
        return "SetComp";
    case SyntaxKind::DictComp:
        return "DictComp";
    case SyntaxKind::GeneratorExp:
        return "GeneratorExp";
    case SyntaxKind::CompFor:
        return "CompFor";
    case SyntaxKind::CompIf:
        return "CompIf";
    case SyntaxKind::Attribute:
        return "Attribute";
    case SyntaxKind::Call:
        return "Call";
    case SyntaxKind::ArgumentList:
        return "ArgumentList";
    case SyntaxKind::Argument:
        return "Argument";
    case SyntaxKind::Subscript:
        return "Subscript";
    case SyntaxKind::Slice:
        return "Slice";
    case SyntaxKind::Comparison:
        return "Comparison";
    case SyntaxKind::BoolOp:
        return "BoolOp";
    case SyntaxKind::UnaryOp:
        return "UnaryOp";
    case SyntaxKind::BinaryOp:
        return "BinaryOp";
    case SyntaxKind::IfExp:
        return "IfExp";
    case SyntaxKind::Lambda:
        return "Lambda";
    case SyntaxKind::NamedExpr:
        return "NamedExpr";
    case SyntaxKind::Starred:
        return "Starred";
    case SyntaxKind::Await:
        return "Await";
    case SyntaxKind::Yield:
        return "Yield";
    }
    return "Unknown";
}

bool isCompoundStatementKind(SyntaxKind kind) {
    switch (kind) {
    case SyntaxKind::If:
    case SyntaxKind::For:
    case SyntaxKind::While:
    case SyntaxKind::With:
    case SyntaxKind::Try:
    case SyntaxKind::FunctionDef:
    case SyntaxKind::ClassDef:
    case SyntaxKind::GenericCompound:
        return true;
    default:
        return false;
    }
}

bool isStatementKind(SyntaxKind kind) {
    return kind == SyntaxKind::SimpleStatement || isCompoundStatementKind(kind);
}

bool isExpressionKind(SyntaxKind kind) {
    return kind >= SyntaxKind::Name && kind != SyntaxKind::DictItem && kind != SyntaxKind::CompFor &&
           kind != SyntaxKind::CompIf && kind != SyntaxKind::ArgumentList && kind != SyntaxKind::Argument &&
           kind != SyntaxKind::Slice;
}

SyntaxNode::SyntaxNode(SyntaxKind kind, NodeList children) : kind_(kind), children_(std::move(children)) {
    if (kind_ == SyntaxKind::Token) {
        throw InvariantViolation("token leaves must be created from a Token");
    }
    for (const auto &child : children_) {
        if (!child) {
            throw InvariantViolation("null child in " + syntaxKindToString(kind_));
        }
        const SourceRange &childRange = child->getRange();
        if (!childRange.isValid()) {
            continue;
        }
        if (!range_.isValid()) {
            range_.start = childRange.start;
        }
        range_.end = childRange.end;
    }
}

SyntaxNode::SyntaxNode(Token token) : kind_(SyntaxKind::Token), token_(std::move(token)) {
    range_ = token_->range;
}

NodePtr SyntaxNode::create(SyntaxKind kind, NodeList children) {
    return std::make_shared<const SyntaxNode>(kind, std::move(children));
}

NodePtr SyntaxNode::createToken(Token token) {
    return std::make_shared<const SyntaxNode>(std::move(token));
}

bool SyntaxNode::isToken(std::string_view text) const {
    return token_ && (token_->kind == TokenKind::Name || token_->kind == TokenKind::Operator) &&
           token_->text == text;
}

const Token &SyntaxNode::getToken() const {
    if (!token_) {
        throw InvariantViolation("getToken() called on " + syntaxKindToString(kind_));
    }
    return *token_;
}

NodeList SyntaxNode::getNodeChildren() const {
    NodeList result;
    for (const auto &child : children_) {
        if (!child->isToken()) {
            result.push_back(child);
        }
    }
    return result;
}

NodePtr SyntaxNode::findChild(SyntaxKind kind) const {
    for (const auto &child : children_) {
        if (child->is(kind)) {
            return child;
        }
    }
    return nullptr;
}

size_t SyntaxNode::findTokenIndex(std::string_view text, size_t from) const {
    for (size_t i = from; i < children_.size(); ++i) {
        if (children_[i]->isToken(text)) {
            return i;
        }
    }
    return std::string::npos;
}

const Token *SyntaxNode::getFirstToken() const {
    if (token_) {
        return &*token_;
    }
    for (const auto &child : children_) {
        if (const Token *token = child->getFirstToken()) {
            return token;
        }
    }
    return nullptr;
}

const Token *SyntaxNode::getLastToken() const {
    if (token_) {
        return &*token_;
    }
    for (auto it = children_.rbegin(); it != children_.rend(); ++it) {
        if (const Token *token = (*it)->getLastToken()) {
            return token;
        }
    }
    return nullptr;
}

std::string SyntaxNode::render() const {
    std::string out;
    renderTo(out);
    return out;
}

void SyntaxNode::renderTo(std::string &out) const {
    if (token_) {
        out += token_->leadingTrivia;
        out += token_->text;
        return;
    }
    for (const auto &child : children_) {
        child->renderTo(out);
    }
}

std::string SyntaxNode::getLeadingTrivia() const {
    const Token *first = getFirstToken();
    return first ? first->leadingTrivia : std::string();
}

std::string SyntaxNode::getSourceText() const {
    std::string text = render();
    return text.substr(getLeadingTrivia().size());
}

}  // namespace TCE
