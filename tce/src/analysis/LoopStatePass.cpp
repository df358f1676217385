#include "analysis/AnalysisPasses.h"
#include "analysis/ScopedWalker.h"
#include "common/Logger.h"
#include "syntax/SyntaxHelper.h"
#include <algorithm>
#include <cctype>
#include <map>

namespace TCE {

namespace {

// In-place mutators whose result is None; a call counts only as a bare statement
const std::set<std::string> IN_PLACE_METHODS = {"append",     "extend",      "insert",     "remove",   "clear",
                                                "add",        "discard",     "update",     "appendleft", "extendleft",
                                                "sort",       "reverse",     "__setitem__", "__delitem__",
                                                "difference_update", "intersection_update",
                                                "symmetric_difference_update", "write"};

// Mutators that also return a value
const std::set<std::string> TAKING_METHODS = {"pop", "popitem", "popleft", "setdefault"};

bool isScopeBoundary(const NodePtr &node) {
    return node->is(SyntaxKind::FunctionDef) || node->is(SyntaxKind::ClassDef) || node->is(SyntaxKind::Lambda);
}

// Leftmost name of an attribute/subscript chain
std::string rootName(const NodePtr &expression) {
    NodePtr current = expression;
    while (current->is(SyntaxKind::Attribute) || current->is(SyntaxKind::Subscript)) {
        current = current->getChild(0);
    }
    return current->is(SyntaxKind::Name) ? current->getChild(0)->getToken().text : "";
}

bool isIntegerLiteral(const NodePtr &expression) {
    NodePtr value = expression;
    if (value->is(SyntaxKind::UnaryOp) && value->getChild(0)->isToken("-")) {
        value = value->getChild(1);
    }
    if (!value->is(SyntaxKind::Literal)) {
        return false;
    }
    const std::string &text = value->getChild(0)->getToken().text;
    return !text.empty() && std::all_of(text.begin(), text.end(), [](char c) {
               return std::isdigit(static_cast<unsigned char>(c)) || c == '_';
           });
}

struct Binding {
    std::string name;
    SourcePosition position;
    bool literalSequence = false;
};

// Every name binding in a function body (nested scopes excluded)
class BindingCollector : public SyntaxWalker {
public:
    std::vector<Binding> bindings;

protected:
    bool enter(const NodePtr &node) override {
        switch (node->getKind()) {
        case SyntaxKind::Assign: {
            const NodeList &children = node->getChildren();
            const NodePtr &value = children.back();
            bool literal = (value->is(SyntaxKind::List) || value->is(SyntaxKind::Tuple)) && SyntaxHelper::isLiteral(value);
            for (size_t i = 0; i + 1 < children.size(); i += 2) {
                addTarget(children[i], literal && children.size() == 3);
            }
            break;
        }
        case SyntaxKind::AugAssign:
        case SyntaxKind::AnnAssign:
            addTarget(node->getChild(0), false);
            break;
        case SyntaxKind::For:
        case SyntaxKind::CompFor:
            addTarget(node->getChild(node->findTokenIndex("for") + 1), false);
            break;
        case SyntaxKind::WithItem:
            if (node->getChildCount() == 3) {
                addTarget(node->getChild(2), false);
            }
            break;
        case SyntaxKind::NamedExpr:
            addTarget(node->getChild(0), false);
            break;
        case SyntaxKind::ExceptClause: {
            size_t asIndex = node->findTokenIndex("as");
            if (asIndex != std::string::npos) {
                const NodePtr &name = node->getChild(asIndex + 1);
                bindings.push_back(Binding{name->getToken().text, name->getRange().start});
            }
            break;
        }
        case SyntaxKind::ImportAlias: {
            size_t asIndex = node->findTokenIndex("as");
            if (asIndex != std::string::npos) {
                const NodePtr &name = node->getChild(asIndex + 1);
                bindings.push_back(Binding{name->getToken().text, name->getRange().start});
            } else {
                std::string dotted = node->getChild(0)->getSourceText();
                bindings.push_back(Binding{dotted.substr(0, dotted.find('.')), node->getRange().start});
            }
            break;
        }
        case SyntaxKind::FunctionDef:
        case SyntaxKind::ClassDef:
            bindings.push_back(Binding{SyntaxHelper::definitionName(node), node->getRange().start});
            return false;
        case SyntaxKind::Lambda:
            return false;
        default:
            break;
        }
        return true;
    }

private:
    void addTarget(const NodePtr &target, bool literalSequence) {
        if (target->is(SyntaxKind::Name)) {
            bindings.push_back(Binding{target->getChild(0)->getToken().text, target->getRange().start, literalSequence});
            return;
        }
        if (target->is(SyntaxKind::Tuple) || target->is(SyntaxKind::List) || target->is(SyntaxKind::Paren) ||
            target->is(SyntaxKind::Starred)) {
            for (const auto &element : target->getNodeChildren()) {
                addTarget(element, false);
            }
        }
    }
};

// Names changed in place: method calls, item or attribute stores, augmented assignment, del
class MutationCollector : public SyntaxWalker {
public:
    std::set<std::string> mutated;

protected:
    bool enter(const NodePtr &node) override {
        switch (node->getKind()) {
        case SyntaxKind::Call: {
            const NodePtr &callee = node->getChild(0);
            if (callee->is(SyntaxKind::Attribute)) {
                markRoot(callee->getChild(0));
            }
            break;
        }
        case SyntaxKind::Assign: {
            const NodeList &children = node->getChildren();
            for (size_t i = 0; i + 1 < children.size(); i += 2) {
                markStore(children[i]);
            }
            break;
        }
        case SyntaxKind::AnnAssign:
            markStore(node->getChild(0));
            break;
        case SyntaxKind::AugAssign:
            markRoot(node->getChild(0));
            break;
        case SyntaxKind::KeywordStatement:
            if (node->getChild(0)->isToken("del")) {
                markStore(node->getChild(1));
            }
            break;
        default:
            break;
        }
        return true;
    }

private:
    void markRoot(const NodePtr &expression) {
        std::string root = rootName(expression);
        if (!root.empty()) {
            mutated.insert(root);
        }
    }

    void markStore(const NodePtr &target) {
        if (target->is(SyntaxKind::Attribute) || target->is(SyntaxKind::Subscript)) {
            markRoot(target);
        } else if (target->is(SyntaxKind::Tuple) || target->is(SyntaxKind::List) || target->is(SyntaxKind::Paren) ||
                   target->is(SyntaxKind::Starred)) {
            for (const auto &element : target->getNodeChildren()) {
                markStore(element);
            }
        }
    }
};

// Scans a loop body for assertions and loop-carried state
class LoopBodyScanner : public SyntaxWalker {
public:
    LoopBodyScanner(const std::set<std::string> &before, const std::set<std::string> &inside,
                    const std::set<std::string> &targets, LoopFact &fact)
        : before_(before), inside_(inside), targets_(targets), fact_(fact) {}

protected:
    bool enter(const NodePtr &node) override {
        if (isScopeBoundary(node)) {
            return false;
        }
        switch (node->getKind()) {
        case SyntaxKind::For:
        case SyntaxKind::While:
            ++nestedLoops_;
            break;
        case SyntaxKind::KeywordStatement: {
            const NodePtr &keyword = node->getChild(0);
            if ((keyword->isToken("break") || keyword->isToken("continue")) && nestedLoops_ == 0) {
                fact_.hasBreakOrContinue = true;
            } else if (keyword->isToken("global") || keyword->isToken("nonlocal")) {
                for (const auto &child : node->getChildren()) {
                    if (child->isToken() && child->getToken().kind == TokenKind::Name && !child->isToken("global") &&
                        !child->isToken("nonlocal")) {
                        fact_.accumulators.insert(child->getToken().text);
                    }
                }
            }
            break;
        }
        case SyntaxKind::Assert:
            fact_.hasAssertion = true;
            break;
        case SyntaxKind::Assign: {
            const NodeList &children = node->getChildren();
            for (size_t i = 0; i + 1 < children.size(); i += 2) {
                checkStore(children[i], false);
            }
            break;
        }
        case SyntaxKind::AnnAssign:
            if (node->getChildCount() > 3) {
                checkStore(node->getChild(0), false);
            }
            break;
        case SyntaxKind::AugAssign:
            checkStore(node->getChild(0), true);
            break;
        case SyntaxKind::ExprStatement:
            statementCall_ = node->getChild(0).get();
            break;
        case SyntaxKind::Call:
            checkCall(node);
            break;
        default:
            break;
        }
        return true;
    }

    void leave(const NodePtr &node) override {
        if (node->is(SyntaxKind::For) || node->is(SyntaxKind::While)) {
            --nestedLoops_;
        }
    }

private:
    bool outlivesIteration(const std::string &name) const {
        if (name.empty() || targets_.count(name) > 0) {
            return false;
        }
        return name == "self" || name == "cls" || before_.count(name) > 0 || inside_.count(name) == 0;
    }

    static std::string describe(const NodePtr &target, const std::string &root) {
        if (root == "self" || root == "cls") {
            NodePtr current = target;
            while ((current->is(SyntaxKind::Attribute) || current->is(SyntaxKind::Subscript)) &&
                   !current->getChild(0)->is(SyntaxKind::Name)) {
                current = current->getChild(0);
            }
            if (current->is(SyntaxKind::Attribute)) {
                return root + "." + current->getChild(2)->getToken().text;
            }
        }
        return root;
    }

    void checkStore(const NodePtr &target, bool augmented) {
        switch (target->getKind()) {
        case SyntaxKind::Name: {
            const std::string &name = target->getChild(0)->getToken().text;
            if (targets_.count(name) > 0) {
                return;
            }
            if (before_.count(name) > 0 || (augmented && inside_.count(name) == 0)) {
                fact_.accumulators.insert(name);
            }
            return;
        }
        case SyntaxKind::Attribute:
        case SyntaxKind::Subscript: {
            std::string root = rootName(target);
            if (outlivesIteration(root)) {
                fact_.accumulators.insert(describe(target, root));
            }
            return;
        }
        case SyntaxKind::Tuple:
        case SyntaxKind::List:
        case SyntaxKind::Paren:
        case SyntaxKind::Starred:
            for (const auto &element : target->getNodeChildren()) {
                checkStore(element, augmented);
            }
            return;
        default:
            return;
        }
    }

    void checkCall(const NodePtr &call) {
        auto method = SyntaxHelper::selfMethodName(call);
        if (method && (method->starts_with("assert") || method->starts_with("fail"))) {
            fact_.hasAssertion = true;
            return;
        }
        if (method && *method == "subTest") {
            fact_.usesSubTest = true;
            return;
        }
        const NodePtr &callee = call->getChild(0);
        if (!callee->is(SyntaxKind::Attribute)) {
            return;
        }
        const std::string &name = callee->getChild(2)->getToken().text;
        bool mutates = TAKING_METHODS.count(name) > 0 ||
                       (IN_PLACE_METHODS.count(name) > 0 && call.get() == statementCall_);
        if (!mutates) {
            return;
        }
        const NodePtr &receiver = callee->getChild(0);
        std::string root = rootName(receiver);
        if (outlivesIteration(root)) {
            fact_.accumulators.insert(describe(receiver, root));
        }
    }

    const std::set<std::string> &before_;
    const std::set<std::string> &inside_;
    const std::set<std::string> &targets_;
    LoopFact &fact_;
    const SyntaxNode *statementCall_ = nullptr;
    int nestedLoops_ = 0;
};

// Collects the loops of one function (nested scopes excluded)
class LoopFinder : public SyntaxWalker {
public:
    NodeList loops;

protected:
    bool enter(const NodePtr &node) override {
        if (node->is(SyntaxKind::For) || node->is(SyntaxKind::While)) {
            loops.push_back(node);
        }
        return !isScopeBoundary(node) && !isExpressionKind(node->getKind());
    }
};

class LoopAnalyzer : public ScopedWalker {
public:
    LoopAnalyzer(const std::map<std::string, int> &moduleLiteralNames, FactSet &facts)
        : moduleLiteralNames_(moduleLiteralNames), facts_(facts) {}

    size_t loopCount = 0;

protected:
    bool onEnter(const NodePtr &node) override {
        if (node->is(SyntaxKind::FunctionDef) && !inFunction()) {
            std::string scope = currentClass();
            std::string name = SyntaxHelper::definitionName(node);
            analyzeFunction(node, scope == MODULE_SCOPE ? name : scope + "." + name);
            return false;
        }
        return isStatementKind(node->getKind()) || node->is(SyntaxKind::Module) || node->is(SyntaxKind::Block) ||
               node->is(SyntaxKind::ElifClause) || node->is(SyntaxKind::ElseClause) ||
               node->is(SyntaxKind::ExceptClause) || node->is(SyntaxKind::FinallyClause);
    }

private:
    void analyzeFunction(const NodePtr &function, const std::string &qualifiedName) {
        NodePtr body = SyntaxHelper::bodyOf(function);
        BindingCollector bindingCollector;
        bindingCollector.walk(body);
        const auto &bindings = bindingCollector.bindings;

        std::vector<std::string> parameters = SyntaxHelper::parameterNames(function);
        MutationCollector mutations;
        mutations.walk(body);

        LoopFinder finder;
        finder.walk(body);
        for (const auto &loop : finder.loops) {
            LoopFact fact;
            fact.position = loop->getRange().start;
            fact.function = qualifiedName;
            fact.isWhile = loop->is(SyntaxKind::While);
            fact.isAsync = SyntaxHelper::isAsync(loop);
            fact.hasElse = loop->findChild(SyntaxKind::ElseClause) != nullptr;

            std::set<std::string> targets;
            if (!fact.isWhile) {
                size_t forIndex = loop->findTokenIndex("for");
                SyntaxHelper::collectTargetNames(loop->getChild(forIndex + 1), targets);
                fact.iterableKind = classifyIterable(loop->getChild(forIndex + 3), bindings, parameters,
                                                     mutations.mutated);
            }

            std::set<std::string> before(parameters.begin(), parameters.end());
            before.erase("self");
            std::set<std::string> inside;
            const SourceRange &range = loop->getRange();
            for (const auto &binding : bindings) {
                if (binding.position < range.start) {
                    before.insert(binding.name);
                } else if (range.contains(binding.position)) {
                    inside.insert(binding.name);
                }
            }

            LoopBodyScanner scanner(before, inside, targets, fact);
            scanner.walk(SyntaxHelper::bodyOf(loop));

            if (!fact.accumulators.empty()) {
                LOG_DEBUG("LoopStatePass: loop at {} in {} carries state: {}", fact.position.toString(), qualifiedName,
                          fact.accumulators.size());
            }
            facts_.add(FactSet::loopKey(fact.position), std::move(fact));
            ++loopCount;
        }
    }

    IterableKind classifyIterable(const NodePtr &iterable, const std::vector<Binding> &bindings,
                                  const std::vector<std::string> &parameters,
                                  const std::set<std::string> &mutated) const {
        if ((iterable->is(SyntaxKind::List) || iterable->is(SyntaxKind::Tuple)) && SyntaxHelper::isLiteral(iterable)) {
            return IterableKind::LiteralSequence;
        }
        if (iterable->is(SyntaxKind::Call) && SyntaxHelper::dottedName(iterable->getChild(0)) == "range") {
            auto arguments = SyntaxHelper::argumentsOf(iterable);
            bool literal = !arguments.empty() && arguments.size() <= 3;
            for (const auto &argument : arguments) {
                literal = literal && argument.kind == SyntaxHelper::CallArgument::Kind::Positional &&
                          isIntegerLiteral(argument.value);
            }
            return literal ? IterableKind::Range : IterableKind::Other;
        }
        if (!iterable->is(SyntaxKind::Name)) {
            return IterableKind::Other;
        }

        const std::string &name = iterable->getChild(0)->getToken().text;
        if (std::find(parameters.begin(), parameters.end(), name) != parameters.end() || mutated.count(name) > 0) {
            return IterableKind::Other;
        }
        int localBindings = 0;
        bool localLiteral = false;
        for (const auto &binding : bindings) {
            if (binding.name == name) {
                ++localBindings;
                localLiteral = binding.literalSequence;
            }
        }
        if (localBindings == 1 && localLiteral) {
            return IterableKind::LiteralName;
        }
        auto it = moduleLiteralNames_.find(name);
        if (localBindings == 0 && it != moduleLiteralNames_.end() && it->second == 1) {
            return IterableKind::LiteralName;
        }
        return IterableKind::Other;
    }

    const std::map<std::string, int> &moduleLiteralNames_;
    FactSet &facts_;
};

}  // namespace

void LoopStatePass::run(const NodePtr &module, const TransformConfig &config, FactSet &facts) {
    (void)config;

    // Module-level names bound exactly once, to a literal list or tuple, and never changed in place
    // anywhere in the module (-1 marks the rest)
    std::map<std::string, int> moduleLiteralNames;
    for (const auto &statement : module->getNodeChildren()) {
        BindingCollector collector;
        collector.walk(statement);
        for (const auto &binding : collector.bindings) {
            int &count = moduleLiteralNames[binding.name];
            count = (binding.literalSequence && count == 0) ? 1 : -1;
        }
    }
    MutationCollector mutations;
    mutations.walk(module);
    for (const auto &name : mutations.mutated) {
        auto it = moduleLiteralNames.find(name);
        if (it != moduleLiteralNames.end()) {
            it->second = -1;
        }
    }

    LoopAnalyzer analyzer(moduleLiteralNames, facts);
    analyzer.walk(module);
    LOG_DEBUG("LoopStatePass: {} loops analyzed", analyzer.loopCount);
}

}  // namespace TCE
