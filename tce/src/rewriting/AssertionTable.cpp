#include "rewriting/AssertionTable.h"
#include "common/Exceptions.h"
#include <algorithm>
#include <map>

namespace TCE {

namespace {

using Kind = AssertionShape::Kind;
using SyntaxHelper::operandText;

const std::vector<std::string> PAIR = {"first", "second", "msg"};
const std::vector<std::string> SINGLE_EXPR = {"expr", "msg"};
const std::vector<std::string> SINGLE_OBJ = {"obj", "msg"};
const std::vector<std::string> MEMBERSHIP = {"member", "container", "msg"};
const std::vector<std::string> INSTANCE = {"obj", "cls", "msg"};
const std::vector<std::string> IDENTITY = {"expr1", "expr2", "msg"};
const std::vector<std::string> REGEX = {"text", "expected_regex", "msg"};
const std::vector<std::string> ALMOST = {"first", "second", "places", "msg", "delta"};

AssertionShape compare(const std::string &op, const std::vector<std::string> &parameters,
                       DegradationTier tier = DegradationTier::Essential) {
    return AssertionShape{Kind::Compare, op, parameters, tier};
}

const std::map<std::string, AssertionShape> &shapes() {
    static const std::map<std::string, AssertionShape> table = [] {
        std::map<std::string, AssertionShape> t;
        for (const char *name : {"assertEqual", "assertEquals", "failUnlessEqual", "assertListEqual",
                                 "assertTupleEqual", "assertSetEqual", "assertDictEqual", "assertMultiLineEqual"}) {
            t.emplace(name, compare("==", PAIR));
        }
        t.emplace("assertSequenceEqual", compare("==", {"seq1", "seq2", "msg", "seq_type"}));
        for (const char *name : {"assertNotEqual", "assertNotEquals", "failIfEqual"}) {
            t.emplace(name, compare("!=", PAIR));
        }
        for (const char *name : {"assertTrue", "failUnless", "assert_"}) {
            t.emplace(name, AssertionShape{Kind::Truth, "", SINGLE_EXPR, DegradationTier::Essential});
        }
        for (const char *name : {"assertFalse", "failIf"}) {
            t.emplace(name, AssertionShape{Kind::Falsity, "", SINGLE_EXPR, DegradationTier::Essential});
        }
        t.emplace("assertIs", compare("is", IDENTITY));
        t.emplace("assertIsNot", compare("is not", IDENTITY));
        t.emplace("assertIsNone", AssertionShape{Kind::IsNone, "", SINGLE_OBJ, DegradationTier::Essential});
        t.emplace("assertIsNotNone", AssertionShape{Kind::IsNotNone, "", SINGLE_OBJ, DegradationTier::Essential});
        t.emplace("assertIn", compare("in", MEMBERSHIP));
        t.emplace("assertNotIn", compare("not in", MEMBERSHIP));
        t.emplace("assertIsInstance", AssertionShape{Kind::IsInstance, "", INSTANCE, DegradationTier::Essential});
        t.emplace("assertNotIsInstance",
                  AssertionShape{Kind::NotIsInstance, "", INSTANCE, DegradationTier::Essential});
        t.emplace("assertGreater", compare(">", {"a", "b", "msg"}));
        t.emplace("assertGreaterEqual", compare(">=", {"a", "b", "msg"}));
        t.emplace("assertLess", compare("<", {"a", "b", "msg"}));
        t.emplace("assertLessEqual", compare("<=", {"a", "b", "msg"}));

        for (const char *name : {"assertCountEqual", "assertItemsEqual"}) {
            t.emplace(name, AssertionShape{Kind::CountEqual, "", PAIR, DegradationTier::Advanced});
        }
        for (const char *name : {"assertRegex", "assertRegexpMatches"}) {
            t.emplace(name, AssertionShape{Kind::Regex, "", REGEX, DegradationTier::Advanced});
        }
        for (const char *name : {"assertNotRegex", "assertNotRegexpMatches"}) {
            t.emplace(name, AssertionShape{Kind::NotRegex, "", REGEX, DegradationTier::Advanced});
        }
        for (const char *name : {"assertAlmostEqual", "assertAlmostEquals"}) {
            t.emplace(name, AssertionShape{Kind::AlmostEqual, "", ALMOST, DegradationTier::Advanced});
        }
        for (const char *name : {"assertNotAlmostEqual", "assertNotAlmostEquals"}) {
            t.emplace(name, AssertionShape{Kind::NotAlmostEqual, "", ALMOST, DegradationTier::Advanced});
        }
        t.emplace("fail", AssertionShape{Kind::Fail, "", {"msg"}, DegradationTier::Advanced});
        t.emplace("skipTest", AssertionShape{Kind::Skip, "", {"reason"}, DegradationTier::Advanced});
        t.emplace("assertDictContainsSubset", AssertionShape{Kind::DictContainsSubset, "",
                                                             {"subset", "dictionary", "msg"},
                                                             DegradationTier::Experimental});
        return t;
    }();
    return table;
}

// Operands of a comparison must bind tighter than the comparison itself
std::string comparand(const NodePtr &expression) {
    return operandText(expression, SyntaxHelper::PRECEDENCE_BIT_OR);
}

std::string argumentText(const NodePtr &expression) {
    return operandText(expression, SyntaxHelper::PRECEDENCE_LAMBDA);
}

std::string difference(const BoundAssertion &bound) {
    return operandText(bound.value("first"), SyntaxHelper::PRECEDENCE_ARITH) + " - " +
           operandText(bound.value("second"), SyntaxHelper::PRECEDENCE_TERM);
}

std::string condition(const BoundAssertion &bound, const TransformConfig &config) {
    const AssertionShape &shape = *bound.shape;
    const auto &names = shape.parameters;
    switch (shape.kind) {
    case Kind::Compare:
        return comparand(bound.value(names[0])) + " " + shape.op + " " + comparand(bound.value(names[1]));
    case Kind::Truth:
        return argumentText(bound.value("expr"));
    case Kind::Falsity:
        return "not " + operandText(bound.value("expr"), SyntaxHelper::PRECEDENCE_NOT);
    case Kind::IsNone:
        return comparand(bound.value("obj")) + " is None";
    case Kind::IsNotNone:
        return comparand(bound.value("obj")) + " is not None";
    case Kind::IsInstance:
        return "isinstance(" + argumentText(bound.value("obj")) + ", " + argumentText(bound.value("cls")) + ")";
    case Kind::NotIsInstance:
        return "not isinstance(" + argumentText(bound.value("obj")) + ", " + argumentText(bound.value("cls")) + ")";
    case Kind::CountEqual:
        return "sorted(" + argumentText(bound.value("first")) + ") == sorted(" + argumentText(bound.value("second")) +
               ")";
    case Kind::Regex:
        return "re.search(" + argumentText(bound.value("expected_regex")) + ", " + argumentText(bound.value("text")) +
               ")";
    case Kind::NotRegex:
        return "not re.search(" + argumentText(bound.value("expected_regex")) + ", " +
               argumentText(bound.value("text")) + ")";
    case Kind::AlmostEqual:
    case Kind::NotAlmostEqual: {
        bool negated = shape.kind == Kind::NotAlmostEqual;
        NodePtr places = bound.value("places");
        NodePtr delta = bound.value("delta");
        if (places && delta) {
            throw RewriteError("places and delta given together");
        }
        if (delta) {
            return "abs(" + difference(bound) + (negated ? ") > " : ") <= ") +
                   operandText(delta, SyntaxHelper::PRECEDENCE_BIT_OR);
        }
        std::string digits = places ? argumentText(places) : std::to_string(config.getDefaultDecimalPlaces());
        return "round(" + difference(bound) + ", " + digits + (negated ? ") != 0" : ") == 0");
    }
    case Kind::DictContainsSubset: {
        std::string dictionary = operandText(bound.value("dictionary"), SyntaxHelper::PRECEDENCE_BIT_OR);
        return "{**" + dictionary + ", **" +
               operandText(bound.value("subset"), SyntaxHelper::PRECEDENCE_BIT_OR) + "} == " + dictionary;
    }
    case Kind::Fail:
    case Kind::Skip:
        break;
    }
    throw RewriteError("assertion shape has no condition");
}

// Text spanning several lines needs brackets once it leaves the call's parentheses
std::string joinLines(const std::string &text) {
    return text.find('\n') == std::string::npos ? text : "(" + text + ")";
}

}  // namespace

NodePtr BoundAssertion::value(const std::string &parameter) const {
    const auto &names = shape->parameters;
    for (size_t i = 0; i < names.size(); ++i) {
        if (names[i] == parameter) {
            return values[i];
        }
    }
    return nullptr;
}

const AssertionShape *AssertionTable::find(const std::string &method) {
    const auto &table = shapes();
    auto it = table.find(method);
    return it == table.end() ? nullptr : &it->second;
}

BoundAssertion AssertionTable::bind(const AssertionShape &shape,
                                    const std::vector<SyntaxHelper::CallArgument> &arguments) {
    using ArgKind = SyntaxHelper::CallArgument::Kind;
    BoundAssertion bound;
    bound.shape = &shape;
    bound.values.assign(shape.parameters.size(), nullptr);

    size_t position = 0;
    for (const auto &argument : arguments) {
        switch (argument.kind) {
        case ArgKind::Positional:
            if (position >= shape.parameters.size()) {
                throw RewriteError("too many positional arguments");
            }
            bound.values[position++] = argument.value;
            break;
        case ArgKind::Keyword: {
            size_t index = 0;
            while (index < shape.parameters.size() && shape.parameters[index] != argument.keyword) {
                ++index;
            }
            if (index == shape.parameters.size()) {
                throw RewriteError("unknown keyword argument '" + argument.keyword + "'");
            }
            if (bound.values[index]) {
                throw RewriteError("argument '" + argument.keyword + "' given twice");
            }
            bound.values[index] = argument.value;
            bound.usedKeywords = true;
            break;
        }
        default:
            throw RewriteError("star or generator arguments cannot be rewritten");
        }
    }

    // Everything before msg (or the optional tail of assertAlmostEqual) is required
    for (size_t i = 0; i < shape.parameters.size(); ++i) {
        const std::string &name = shape.parameters[i];
        bool optional = name == "msg" || name == "places" || name == "delta" || name == "seq_type" ||
                        name == "reason" || shape.kind == Kind::Fail;
        if (!optional && !bound.values[i]) {
            throw RewriteError("missing argument '" + name + "'");
        }
    }
    return bound;
}

DegradationTier AssertionTable::requiredTier(const AssertionShape &shape,
                                             const std::vector<SyntaxHelper::CallArgument> &arguments) {
    if (shape.tier != DegradationTier::Essential) {
        return shape.tier;
    }
    auto msg = std::find(shape.parameters.begin(), shape.parameters.end(), "msg");
    size_t plainCount = static_cast<size_t>(msg - shape.parameters.begin());
    if (arguments.size() > plainCount) {
        return DegradationTier::Advanced;
    }
    for (const auto &argument : arguments) {
        if (argument.kind != SyntaxHelper::CallArgument::Kind::Positional) {
            return DegradationTier::Advanced;
        }
    }
    return DegradationTier::Essential;
}

std::string AssertionTable::render(const BoundAssertion &bound, const TransformConfig &config) {
    const AssertionShape &shape = *bound.shape;
    if (shape.kind == Kind::Fail) {
        NodePtr message = bound.value("msg");
        return "pytest.fail(" + (message ? argumentText(message) : std::string()) + ")";
    }
    if (shape.kind == Kind::Skip) {
        NodePtr reason = bound.value("reason");
        return "pytest.skip(" + (reason ? argumentText(reason) : std::string()) + ")";
    }
    if (bound.value("seq_type")) {
        throw RewriteError("seq_type has no plain assert equivalent");
    }

    std::string statement = "assert " + joinLines(condition(bound, config));
    if (NodePtr message = bound.value("msg")) {
        statement += ", " + joinLines(argumentText(message));
    }
    return statement;
}

}  // namespace TCE
