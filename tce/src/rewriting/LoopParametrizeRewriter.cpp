#include "rewriting/LoopParametrizeRewriter.h"
#include "common/Constants.h"
#include "common/Exceptions.h"
#include "common/StringUtils.h"
#include "rewriting/RewriteHelper.h"
#include "rewriting/TextualRepair.h"
#include "syntax/SyntaxHelper.h"
#include "syntax/TreeEditor.h"
#include <algorithm>
#include <format>

namespace TCE {

namespace {

size_t forIndexOf(const NodePtr &loop) {
    return loop->findTokenIndex("for");
}

NodePtr targetOf(const NodePtr &loop) {
    return loop->getChild(forIndexOf(loop) + 1);
}

NodePtr iterableOf(const NodePtr &loop) {
    return loop->getChild(forIndexOf(loop) + 3);
}

long long integerValue(const NodePtr &expression) {
    bool negative = false;
    NodePtr value = expression;
    if (value->is(SyntaxKind::UnaryOp)) {
        negative = value->getChild(0)->isToken("-");
        value = value->getChild(1);
    }
    std::string digits = value->getChild(0)->getToken().text;
    digits.erase(std::remove(digits.begin(), digits.end(), '_'), digits.end());
    long long result = std::stoll(digits);
    return negative ? -result : result;
}

size_t rangeCount(const NodePtr &call) {
    std::vector<long long> values;
    for (const auto &argument : SyntaxHelper::argumentsOf(call)) {
        values.push_back(integerValue(argument.value));
    }
    long long start = values.size() > 1 ? values[0] : 0;
    long long stop = values.size() > 1 ? values[1] : values[0];
    long long step = values.size() > 2 ? values[2] : 1;
    if (step == 0) {
        throw RewriteError("range() step is zero");
    }
    long long span = step > 0 ? stop - start : start - stop;
    long long magnitude = step > 0 ? step : -step;
    return span <= 0 ? 0 : static_cast<size_t>((span + magnitude - 1) / magnitude);
}

// `with self.subTest(...):` without alias, the only statement of the loop body
NodePtr subTestBlock(const NodePtr &body) {
    NodeList statements = SyntaxHelper::statementsOf(body);
    if (statements.size() != 1 || !statements[0]->is(SyntaxKind::With)) {
        return nullptr;
    }
    const NodePtr &with = statements[0];
    NodeList items;
    for (const auto &child : with->getChildren()) {
        if (child->is(SyntaxKind::WithItem)) {
            items.push_back(child);
        }
    }
    if (items.size() != 1 || items[0]->getChildCount() != 1 || SyntaxHelper::isAsync(with)) {
        return nullptr;
    }
    auto method = SyntaxHelper::selfMethodName(items[0]->getChild(0));
    return method && *method == "subTest" ? SyntaxHelper::bodyOf(with) : nullptr;
}

bool assignsName(const NodePtr &node, const std::string &name) {
    if (node->is(SyntaxKind::Assign)) {
        std::set<std::string> targets;
        for (size_t i = 0; i + 1 < node->getChildCount(); ++i) {
            if (node->getChild(i + 1)->isToken("=")) {
                SyntaxHelper::collectTargetNames(node->getChild(i), targets);
            }
        }
        if (targets.count(name)) {
            return true;
        }
    }
    for (const auto &child : node->getNodeChildren()) {
        if (assignsName(child, name)) {
            return true;
        }
    }
    return false;
}

std::string sanitizedId(const std::string &text) {
    std::string id;
    for (char c : text) {
        id += isIdentifierChar(c) || c == '.' || c == '-' ? c : '_';
    }
    return id;
}

std::string stringContent(const NodePtr &string) {
    if (string->getChildCount() != 1) {
        return "";
    }
    const std::string &text = string->getChild(0)->getToken().text;
    size_t quote = text.find_first_of("'\"");
    std::string prefix = text.substr(0, quote);
    if (quote == std::string::npos || prefix.find_first_of("bB") != std::string::npos ||
        text.find('\\') != std::string::npos) {
        return "";
    }
    size_t width = text.compare(quote, 3, std::string(3, text[quote])) == 0 ? 3 : 1;
    if (text.size() < quote + 2 * width) {
        return "";
    }
    return text.substr(quote + width, text.size() - quote - 2 * width);
}

std::string valueType(const NodePtr &element) {
    if (element->is(SyntaxKind::String)) {
        std::string text = element->getChild(0)->getToken().text;
        std::string prefix = text.substr(0, text.find_first_of("'\""));
        return prefix.find_first_of("bB") != std::string::npos ? "bytes" : "str";
    }
    if (element->is(SyntaxKind::Name)) {
        const std::string &name = element->getChild(0)->getToken().text;
        return name == "True" || name == "False" ? "bool" : "";
    }
    NodePtr number = element;
    if (number->is(SyntaxKind::UnaryOp)) {
        number = number->getChild(1);
    }
    if (!number->is(SyntaxKind::Literal)) {
        return "";
    }
    const std::string &text = number->getChild(0)->getToken().text;
    if (text.find_first_of("jJ") != std::string::npos) {
        return "complex";
    }
    bool hex = text.size() > 1 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X');
    if (!hex && text.find_first_of(".eE") != std::string::npos) {
        return "float";
    }
    return "int";
}

}  // namespace

bool LoopParametrizeRewriter::matches(const LoopFact &loop) {
    return !loop.isWhile && loop.hasAssertion && (loop.iterableKind != IterableKind::Other || loop.hasAccumulator());
}

std::vector<std::string> LoopParametrizeRewriter::targetNames(const NodePtr &loop) {
    std::vector<std::string> names;
    NodePtr target = targetOf(loop);
    if (target->is(SyntaxKind::Name)) {
        names.push_back(target->getChild(0)->getToken().text);
        return names;
    }
    if (!target->is(SyntaxKind::Tuple) && !target->is(SyntaxKind::List)) {
        return names;
    }
    for (const auto &element : target->getNodeChildren()) {
        if (!element->is(SyntaxKind::Name)) {
            return {};
        }
        names.push_back(element->getChild(0)->getToken().text);
    }
    return names;
}

std::string LoopParametrizeRewriter::caseId(const NodePtr &element) {
    std::string id;
    if (element->is(SyntaxKind::String)) {
        id = stringContent(element);
        if (id.empty()) {
            id = sanitizedId(element->getSourceText());
        }
    } else if (element->is(SyntaxKind::Literal) || element->is(SyntaxKind::UnaryOp) ||
               element->is(SyntaxKind::Name)) {
        id = element->getSourceText();
    } else if ((element->is(SyntaxKind::Tuple) || element->is(SyntaxKind::List)) && SyntaxHelper::isLiteral(element)) {
        std::vector<std::string> parts;
        for (const auto &child : element->getNodeChildren()) {
            parts.push_back(caseId(child));
        }
        id = join(parts, "-");
    } else {
        id = sanitizedId(element->getSourceText());
    }
    if (id.find_first_of("\r\n") != std::string::npos) {
        id = sanitizedId(id);
    }
    if (id.size() > Constants::MAX_CASE_ID_LENGTH) {
        id.resize(Constants::MAX_CASE_ID_LENGTH);
    }
    return id;
}

std::optional<std::string> LoopParametrizeRewriter::ambiguity(const NodePtr &function, const NodePtr &loop,
                                                              const LoopFact &fact) const {
    if (fact.hasAccumulator()) {
        std::vector<std::string> names(fact.accumulators.begin(), fact.accumulators.end());
        return "loop carries state across iterations: " + join(names, ", ");
    }
    if (fact.hasBreakOrContinue) {
        return std::string("loop uses break or continue");
    }
    if (fact.hasElse) {
        return std::string("loop has an else clause");
    }
    if (fact.isAsync) {
        return std::string("async for-loop");
    }
    NodeList statements = SyntaxHelper::statementsOf(SyntaxHelper::bodyOf(function));
    if (statements.empty() || statements.back() != loop) {
        return std::string("loop is not the last statement of the test");
    }
    if (RewriteHelper::hasDecorator(function, "parametrize")) {
        return std::string("test is already parametrized");
    }

    std::vector<std::string> names = targetNames(loop);
    if (names.empty()) {
        return std::string("loop target is not a name or a tuple of names");
    }
    std::vector<std::string> parameters = SyntaxHelper::parameterNames(function);
    for (const auto &name : names) {
        if (std::find(parameters.begin(), parameters.end(), name) != parameters.end()) {
            return "loop target '" + name + "' collides with a parameter";
        }
        for (size_t i = 0; i + 1 < statements.size(); ++i) {
            if (SyntaxHelper::referencesName(statements[i], name)) {
                return "loop target '" + name + "' is used before the loop";
            }
        }
    }

    if (fact.iterableKind == IterableKind::Range) {
        size_t count = rangeCount(iterableOf(loop));
        if (count == 0 || count > Constants::MAX_PARAMETRIZE_CASES) {
            return std::format("range() yields {} cases", count);
        }
        if (names.size() != 1) {
            return std::string("range() loop with a tuple target");
        }
    }
    return std::nullopt;
}

NodePtr LoopParametrizeRewriter::literalBinding(const NodePtr &function, const NodePtr &loop, const std::string &name,
                                                bool &moduleLevel) const {
    auto bindingIn = [&name](const NodeList &statements, const NodePtr &stop) -> NodePtr {
        NodePtr found;
        for (const auto &statement : statements) {
            if (statement == stop) {
                break;
            }
            if (!statement->is(SyntaxKind::SimpleStatement) || statement->getChildCount() != 2) {
                continue;
            }
            const NodePtr &small = statement->getChild(0);
            if (small->is(SyntaxKind::Assign) && small->getChildCount() == 3 &&
                SyntaxHelper::dottedName(small->getChild(0)) == name) {
                found = small->getChild(2);
            }
        }
        return found;
    };

    moduleLevel = false;
    if (NodePtr local = bindingIn(SyntaxHelper::statementsOf(SyntaxHelper::bodyOf(function)), loop)) {
        return local;
    }
    if (assignsName(SyntaxHelper::bodyOf(function), name)) {
        throw RewriteError("'" + name + "' is bound inside a nested block");
    }
    moduleLevel = true;
    return bindingIn(module_->getNodeChildren(), nullptr);
}

LoopParametrizeRewriter::CaseData LoopParametrizeRewriter::caseData(const NodePtr &function, const NodePtr &loop,
                                                                    const LoopFact &fact) const {
    CaseData data;
    NodePtr iterable = iterableOf(loop);
    switch (fact.iterableKind) {
    case IterableKind::Range:
        data.isRange = true;
        data.rangeCount = rangeCount(iterable);
        data.argvalues = iterable->getSourceText();
        return data;
    case IterableKind::LiteralSequence:
        data.elements = iterable->getNodeChildren();
        data.argvalues = "[" + iterable->getSourceText() + "]";
        if (iterable->is(SyntaxKind::List) || iterable->getChild(0)->isToken("(")) {
            data.argvalues = iterable->getSourceText();
        }
        break;
    case IterableKind::LiteralName: {
        const std::string &name = iterable->getChild(0)->getToken().text;
        bool moduleLevel = false;
        NodePtr value = literalBinding(function, loop, name, moduleLevel);
        if (!value || (!value->is(SyntaxKind::List) && !value->is(SyntaxKind::Tuple))) {
            throw RewriteError("binding of '" + name + "' not found");
        }
        data.elements = value->getNodeChildren();
        bool definedEarlier = value->getRange().isValid() && function->getRange().isValid() &&
                              value->getRange().start < function->getRange().start;
        data.argvalues = moduleLevel && definedEarlier ? name : value->getSourceText();
        if (!value->is(SyntaxKind::List) && !value->getChild(0)->isToken("(")) {
            data.argvalues = moduleLevel && definedEarlier ? name : "[" + value->getSourceText() + "]";
        }
        break;
    }
    case IterableKind::Other:
        throw RewriteError("iterable is not literal data");
    }

    if (data.elements.empty()) {
        throw RewriteError("iterable is empty");
    }
    if (data.elements.size() > Constants::MAX_PARAMETRIZE_CASES) {
        throw RewriteError(std::format("{} cases exceed the parametrize limit", data.elements.size()));
    }
    for (const auto &element : data.elements) {
        if (element->is(SyntaxKind::Starred)) {
            throw RewriteError("starred element in iterable");
        }
    }
    return data;
}

std::string LoopParametrizeRewriter::annotationFor(const CaseData &data, size_t position, size_t width) const {
    if (data.isRange) {
        return "int";
    }
    std::string common;
    for (const auto &element : data.elements) {
        NodePtr value = element;
        if (width > 1) {
            NodeList parts = element->getNodeChildren();
            value = parts.at(position);
        }
        std::string type = valueType(value);
        if (type.empty() || (!common.empty() && type != common)) {
            return "";
        }
        common = type;
    }
    return common;
}

AttemptResult LoopParametrizeRewriter::lower(const NodePtr &function, const LoopFact &fact,
                                             DegradationController &controller) const {
    NodePtr located = RewriteHelper::findNodeAt(function, SyntaxKind::For, fact.position);
    RewriteRequest request;
    request.family = FAMILY;
    request.range = located ? located->getRange() : SourceRange{fact.position, fact.position};
    request.requiredTier = DegradationTier::Advanced;
    request.description = "loop -> pytest.mark.parametrize";

    auto rewrite = [this, &fact](const NodePtr &original) {
        NodePtr loop = RewriteHelper::findNodeAt(original, SyntaxKind::For, fact.position);
        if (!loop) {
            throw RewriteError("loop not found");
        }
        std::vector<std::string> names = targetNames(loop);
        CaseData data = caseData(original, loop, fact);
        if (names.size() > 1) {
            for (const auto &element : data.elements) {
                bool tupleLike = element->is(SyntaxKind::Tuple) || element->is(SyntaxKind::List);
                if (!tupleLike || element->getNodeChildren().size() != names.size()) {
                    throw RewriteError("element '" + element->getSourceText() + "' does not unpack into " +
                                       std::to_string(names.size()) + " values");
                }
            }
        }

        // Loop body moves up to the function body, replacing the loop
        NodePtr loopBody = SyntaxHelper::bodyOf(loop);
        if (NodePtr unwrapped = subTestBlock(loopBody)) {
            loopBody = unwrapped;
        }
        NodeList moved = SyntaxHelper::statementsOf(loopBody);
        std::string from = TreeEditor::indentationOf(moved.front());
        std::string to = TreeEditor::indentationOf(loop);
        NodeList statements = SyntaxHelper::statementsOf(SyntaxHelper::bodyOf(original));
        statements.pop_back();
        for (size_t i = 0; i < moved.size(); ++i) {
            NodePtr statement = TreeEditor::reindent(moved[i], from, to);
            if (i == 0) {
                statement = TreeEditor::withLeadingTrivia(
                    statement, TreeEditor::leadingLinesOf(loop) + statement->getLeadingTrivia());
            }
            statements.push_back(statement);
        }
        NodePtr body = SyntaxHelper::bodyOf(original);
        NodePtr result = TreeEditor::replaceNode(original, body.get(), SyntaxHelper::withStatements(body, statements));

        for (size_t i = 0; i < names.size(); ++i) {
            std::string annotation =
                config_.generatesParametrizeAnnotations() ? annotationFor(data, i, names.size()) : "";
            result = RewriteHelper::addParameter(result, names[i], annotation);
        }

        std::string decorator = "pytest.mark.parametrize(" + quotePython(join(names, ",")) + ", " + data.argvalues;
        if (config_.generatesParametrizeIds() && !data.isRange) {
            std::vector<std::string> ids;
            for (const auto &element : data.elements) {
                ids.push_back(quotePython(caseId(element)));
            }
            decorator += ", ids=[" + join(ids, ", ") + "]";
        }
        decorator += ")";
        return RewriteHelper::addDecorator(result, decorator);
    };

    return controller.attempt(request, function, rewrite, TextualRepair::relocatingComments(rewrite));
}

}  // namespace TCE
