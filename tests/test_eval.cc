#include <gtest/gtest.h>

#include <memory>
#include <sstream>

#include "ClassRuntime.hpp"
#include "ErrorReporter.hpp"
#include "cli_commands.hpp"
#include "evaluator.hpp"
#include "lexer.hpp"
#include "parser.hpp"
#include "test_helpers.hpp"

// Runs a program on a fresh evaluator and captures what it prints
class EvaluatorTestHelper {
   public:
    struct Run {
        std::string out;
        std::string err;
        int exit_code = 0;
    };

    static Run run(const std::string& source) {
        std::ostringstream out, err;
        ErrorReporter reporter(err);
        Evaluator evaluator(reporter, out);
        auto result = lox::cli::run_source(source, "test.lox", evaluator, reporter);
        return Run{out.str(), err.str(), result.exit_code};
    }

    static std::string output(const std::string& source) {
        return run(source).out;
    }

    // Value of a single expression
    static Value eval(const std::string& source, Evaluator& evaluator, ErrorReporter& reporter) {
        Lexer lexer(source + ";", "test.lox", reporter);
        std::vector<Token> tokens = lexer.tokenize();
        Parser parser(tokens, reporter);
        auto ast = parser.parse();
        if (!ast->body.empty()) {
            if (auto expr_stmt = dynamic_cast<ExpressionStatementNode*>(ast->body[0].get())) {
                return evaluator.evaluate_expression(expr_stmt->expression.get());
            }
        }
        return std::monostate{};
    }

    static std::string evalToString(const std::string& source) {
        std::ostringstream out, err;
        ErrorReporter reporter(err);
        Evaluator evaluator(reporter, out);
        return evaluator.value_to_string(eval(source, evaluator, reporter));
    }
};

// ============================================================================
// ARITHMETIC AND OPERATORS
// ============================================================================

TEST(EvaluatorTest, PrecedenceOfArithmetic) {
    EXPECT_EQ(EvaluatorTestHelper::evalToString("1 + 2 * 3"), "7");
    EXPECT_EQ(EvaluatorTestHelper::evalToString("(1 + 2) * 3"), "9");
    EXPECT_EQ(EvaluatorTestHelper::evalToString("10 - 4 - 3"), "3");
}

TEST(EvaluatorTest, EvaluatesToDouble) {
    std::ostringstream out, err;
    ErrorReporter reporter(err);
    Evaluator evaluator(reporter, out);
    Value result = EvaluatorTestHelper::eval("4 * 7", evaluator, reporter);

    ASSERT_TRUE(std::holds_alternative<double>(result));
    EXPECT_DOUBLE_EQ(std::get<double>(result), 28.0);
}

TEST(EvaluatorTest, DivisionFollowsIEEE) {
    EXPECT_EQ(EvaluatorTestHelper::evalToString("7 / 2"), "3.5");
    EXPECT_EQ(EvaluatorTestHelper::evalToString("1 / 0"), "inf");
    EXPECT_EQ(EvaluatorTestHelper::evalToString("-1 / 0"), "-inf");
    EXPECT_EQ(EvaluatorTestHelper::evalToString("0 / 0"), "nan");
}

TEST(EvaluatorTest, StringConcatenation) {
    EXPECT_EQ(EvaluatorTestHelper::output("print \"a\" + \"b\";"), "ab\n");
}

TEST(EvaluatorTest, MixedPlusIsRuntimeError) {
    auto run = EvaluatorTestHelper::run("print \"a\" + 1;");
    EXPECT_EQ(run.exit_code, 70);
    EXPECT_EQ(run.out, "");
    EXPECT_NE(run.err.find("Operands must be two numbers or two strings.\n[line 1]"), std::string::npos) << run.err;
}

TEST(EvaluatorTest, ArithmeticOnNonNumbers) {
    auto run = EvaluatorTestHelper::run("print 1 - \"x\";");
    EXPECT_NE(run.err.find("Operands must be numbers."), std::string::npos);

    auto cmp = EvaluatorTestHelper::run("print \"a\" < \"b\";");
    EXPECT_NE(cmp.err.find("Operands must be numbers."), std::string::npos);

    auto neg = EvaluatorTestHelper::run("print -\"x\";");
    EXPECT_NE(neg.err.find("Operand must be a number."), std::string::npos);
}

TEST(EvaluatorTest, Comparisons) {
    EXPECT_EQ(EvaluatorTestHelper::output("print 1 < 2; print 2 <= 2; print 3 > 4; print 4 >= 5;"),
        "true\ntrue\nfalse\nfalse\n");
}

TEST(EvaluatorTest, Truthiness) {
    EXPECT_EQ(EvaluatorTestHelper::evalToString("!nil"), "true");
    EXPECT_EQ(EvaluatorTestHelper::evalToString("!0"), "false");
    EXPECT_EQ(EvaluatorTestHelper::evalToString("!\"\""), "false");
    EXPECT_EQ(EvaluatorTestHelper::evalToString("!false"), "true");
}

TEST(EvaluatorTest, EqualityHasNoCoercion) {
    EXPECT_EQ(EvaluatorTestHelper::output(
                  "print nil == nil; print nil == false; print 1 == \"1\"; print \"a\" == \"a\"; print 0 / 0 == 0 / 0;"),
        "true\nfalse\nfalse\ntrue\nfalse\n");
}

TEST(EvaluatorTest, LogicalOperatorsYieldDecidingOperand) {
    EXPECT_EQ(EvaluatorTestHelper::output("print nil or \"yes\"; print 1 and 2; print false and boom; print \"x\" or boom;"),
        "yes\n2\nfalse\nx\n");
}

// ============================================================================
// VARIABLES, SCOPES AND CONTROL FLOW
// ============================================================================

TEST(EvaluatorTest, UninitializedVariableIsNil) {
    EXPECT_EQ(EvaluatorTestHelper::output("var a; print a;"), "nil\n");
}

TEST(EvaluatorTest, AssignmentIsAnExpression) {
    EXPECT_EQ(EvaluatorTestHelper::output("var a; var b; a = b = 3; print a + b;"), "6\n");
}

TEST(EvaluatorTest, UndefinedVariable) {
    auto run = EvaluatorTestHelper::run("print 1;\nprint missing;");
    EXPECT_EQ(run.out, "1\n");
    EXPECT_EQ(run.exit_code, 70);
    EXPECT_NE(run.err.find("Undefined variable 'missing'.\n[line 2]"), std::string::npos) << run.err;
}

TEST(EvaluatorTest, AssignToUndeclaredIsError) {
    auto run = EvaluatorTestHelper::run("x = 1;");
    EXPECT_NE(run.err.find("Undefined variable 'x'."), std::string::npos);
}

TEST(EvaluatorTest, ShadowingInBlock) {
    EXPECT_EQ(EvaluatorTestHelper::output("var a = 1; { var a = 2; print a; } print a;"), "2\n1\n");
}

TEST(EvaluatorTest, BlockAssignsOuterVariable) {
    EXPECT_EQ(EvaluatorTestHelper::output("var a = 1; { a = 2; } print a;"), "2\n");
}

TEST(EvaluatorTest, IfElse) {
    EXPECT_EQ(EvaluatorTestHelper::output("if (1 > 2) print \"a\"; else print \"b\"; if (nil) print \"c\";"), "b\n");
}

TEST(EvaluatorTest, WhileLoop) {
    EXPECT_EQ(EvaluatorTestHelper::output("var i = 0; while (i < 3) { print i; i = i + 1; }"), "0\n1\n2\n");
}

TEST(EvaluatorTest, ForLoop) {
    EXPECT_EQ(EvaluatorTestHelper::output("for (var i = 0; i < 3; i = i + 1) print i;"), "0\n1\n2\n");
}

TEST(EvaluatorTest, ForLoopVariableIsScopedToLoop) {
    auto run = EvaluatorTestHelper::run("for (var i = 0; i < 1; i = i + 1) {} print i;");
    EXPECT_NE(run.err.find("Undefined variable 'i'."), std::string::npos);
}

TEST(EvaluatorTest, BreakLeavesInnermostLoop) {
    const char* src =
        "for (var i = 0; i < 3; i = i + 1) {\n"
        "  var j = 0;\n"
        "  while (true) { if (j == 2) break; j = j + 1; }\n"
        "  print i * 10 + j;\n"
        "  if (i == 1) break;\n"
        "}\n";
    EXPECT_EQ(EvaluatorTestHelper::output(src), "2\n12\n");
}

TEST(EvaluatorTest, PrintsNumbersWithoutTrailingZeros) {
    EXPECT_EQ(EvaluatorTestHelper::output("print 7; print 2.5; print -3; print 0.1;"), "7\n2.5\n-3\n0.1\n");
}

TEST(EvaluatorTest, PrintsShortestRoundTripNumber) {
    EXPECT_EQ(EvaluatorTestHelper::output("print 3.14159265; print 1234567.5; print 0.1 + 0.2;"),
        "3.14159265\n1234567.5\n0.30000000000000004\n");
    EXPECT_EQ(EvaluatorTestHelper::evalToString("1 / 3"), "0.3333333333333333");
    EXPECT_EQ(EvaluatorTestHelper::evalToString("-0.000125"), "-0.000125");
}

// ============================================================================
// FUNCTIONS AND CLOSURES
// ============================================================================

TEST(EvaluatorTest, FunctionCallAndReturn) {
    EXPECT_EQ(EvaluatorTestHelper::output("fun add(a, b) { return a + b; } print add(2, 3);"), "5\n");
}

TEST(EvaluatorTest, FunctionWithoutReturnYieldsNil) {
    EXPECT_EQ(EvaluatorTestHelper::output("fun f() { 1; } print f();"), "nil\n");
}

TEST(EvaluatorTest, ReturnFromNestedLoop) {
    const char* src =
        "fun find() {\n"
        "  for (var i = 0; i < 10; i = i + 1) {\n"
        "    while (true) { if (i == 3) return i; break; }\n"
        "  }\n"
        "  return -1;\n"
        "}\n"
        "print find();\n";
    EXPECT_EQ(EvaluatorTestHelper::output(src), "3\n");
}

TEST(EvaluatorTest, Recursion) {
    EXPECT_EQ(EvaluatorTestHelper::output("fun fib(n) { if (n < 2) return n; return fib(n - 1) + fib(n - 2); } print fib(15);"),
        "610\n");
}

TEST(EvaluatorTest, ClosuresShareCapturedState) {
    const char* src =
        "fun makeCounter() {\n"
        "  var i = 0;\n"
        "  fun count() { i = i + 1; return i; }\n"
        "  return count;\n"
        "}\n"
        "var c = makeCounter();\n"
        "print c(); print c();\n"
        "var d = makeCounter();\n"
        "print d(); print c();\n";
    EXPECT_EQ(EvaluatorTestHelper::output(src), "1\n2\n1\n3\n");
}

TEST(EvaluatorTest, ClosureCapturesDeclarationScope) {
    const char* src =
        "var a = \"global\";\n"
        "fun show() { print a; }\n"
        "fun caller() { var a = \"local\"; show(); }\n"
        "caller();\n";
    EXPECT_EQ(EvaluatorTestHelper::output(src), "global\n");
}

TEST(EvaluatorTest, WrongArityAlwaysErrors) {
    auto few = EvaluatorTestHelper::run("fun f(a, b) {} f(1);");
    EXPECT_NE(few.err.find("Expected 2 arguments but got 1."), std::string::npos);

    auto many = EvaluatorTestHelper::run("fun f() {} f(1, 2);");
    EXPECT_NE(many.err.find("Expected 0 arguments but got 2."), std::string::npos);

    auto cls = EvaluatorTestHelper::run("class A { init(x) {} } A();");
    EXPECT_NE(cls.err.find("Expected 1 arguments but got 0."), std::string::npos);

    auto native = EvaluatorTestHelper::run("clock(1);");
    EXPECT_NE(native.err.find("Expected 0 arguments but got 1."), std::string::npos);
}

TEST(EvaluatorTest, CallingNonCallable) {
    auto run = EvaluatorTestHelper::run("\"not a fn\"();");
    EXPECT_NE(run.err.find("Can only call functions and classes."), std::string::npos);
}

TEST(EvaluatorTest, ClockReturnsSeconds) {
    EXPECT_EQ(EvaluatorTestHelper::output("var t = clock(); print t > 1000000000;"), "true\n");
}

TEST(EvaluatorTest, StringForms) {
    EXPECT_EQ(EvaluatorTestHelper::output(
                  "fun f() {} class A {} print f; print clock; print A; print A(); print nil; print true;"),
        "<fn f>\n<native fn>\nA\nA instance\nnil\ntrue\n");
}

TEST(EvaluatorTest, DeepRecursionIsStackOverflow) {
    auto run = EvaluatorTestHelper::run("fun f(n) { return f(n + 1); } f(0);");
    EXPECT_EQ(run.exit_code, 70);
    EXPECT_NE(run.err.find("Stack overflow."), std::string::npos);
}

TEST(EvaluatorTest, DeepRecursionWithinStackSucceeds) {
    EvaluatorTestHelper::Run run;
    bool started = run_with_stack(64 * 1024 * 1024, [&] {
        run = EvaluatorTestHelper::run(
            "fun f(n) { if (n == 0) return 0; return 1 + f(n - 1); }\n"
            "print f(5000);\n");
    });
    ASSERT_TRUE(started);
    EXPECT_EQ(run.exit_code, 0) << run.err;
    EXPECT_EQ(run.out, "5000\n");
}

static std::string long_sum(int terms) {
    std::string src = "print 0";
    for (int i = 1; i < terms; ++i) src += "+1";
    return src + ";";
}

TEST(EvaluatorTest, LongOperatorChainOnSmallStackIsStackOverflow) {
    const std::string src = long_sum(20000);
    EvaluatorTestHelper::Run run;
    bool started = run_with_stack(1024 * 1024, [&] { run = EvaluatorTestHelper::run(src); });
    ASSERT_TRUE(started);
    EXPECT_EQ(run.exit_code, 70);
    EXPECT_EQ(run.out, "");
    EXPECT_NE(run.err.find("Stack overflow."), std::string::npos) << run.err;
}

TEST(EvaluatorTest, LongOperatorChainOnLargeStack) {
    const std::string src = long_sum(20000);
    EvaluatorTestHelper::Run run;
    bool started = run_with_stack(64 * 1024 * 1024, [&] { run = EvaluatorTestHelper::run(src); });
    ASSERT_TRUE(started);
    EXPECT_EQ(run.exit_code, 0) << run.err;
    EXPECT_EQ(run.out, "19999\n");
}

TEST(EvaluatorTest, CallDepthLimitIsConfigurable) {
    std::ostringstream out, err;
    ErrorReporter reporter(err);
    Evaluator evaluator(reporter, out);
    evaluator.set_max_call_depth(10);

    auto ok = lox::cli::run_source("fun d(n) { if (n == 0) return 0; return d(n - 1); } print d(9);",
        "test.lox", evaluator, reporter);
    EXPECT_EQ(ok.exit_code, 0);
    EXPECT_EQ(out.str(), "0\n");

    auto too_deep = lox::cli::run_source("print d(10);", "test.lox", evaluator, reporter);
    EXPECT_EQ(too_deep.exit_code, 70);
}

// ============================================================================
// CLASSES
// ============================================================================

TEST(EvaluatorTest, FieldsAndMethods) {
    const char* src =
        "class Point {\n"
        "  init(x, y) { this.x = x; this.y = y; }\n"
        "  sum() { return this.x + this.y; }\n"
        "}\n"
        "var p = Point(1, 2);\n"
        "print p.sum();\n"
        "p.x = 10;\n"
        "print p.sum();\n";
    EXPECT_EQ(EvaluatorTestHelper::output(src), "3\n12\n");
}

TEST(EvaluatorTest, FieldsShadowMethods) {
    EXPECT_EQ(EvaluatorTestHelper::output("class A { m() { return 1; } } var a = A(); a.m = 2; print a.m;"), "2\n");
}

TEST(EvaluatorTest, BoundMethodRemembersInstance) {
    const char* src =
        "class Box { init(v) { this.v = v; } get() { return this.v; } }\n"
        "var g = Box(\"inside\").get;\n"
        "print g();\n";
    EXPECT_EQ(EvaluatorTestHelper::output(src), "inside\n");
}

TEST(EvaluatorTest, InitAlwaysReturnsInstance) {
    const char* src =
        "class A { init() { this.n = 1; return; } }\n"
        "var a = A();\n"
        "print a.init();\n"
        "print a.n;\n";
    EXPECT_EQ(EvaluatorTestHelper::output(src), "A instance\n1\n");
}

TEST(EvaluatorTest, UndefinedProperty) {
    auto run = EvaluatorTestHelper::run("class A {} A().nope;");
    EXPECT_NE(run.err.find("Undefined property 'nope'."), std::string::npos);
}

TEST(EvaluatorTest, PropertyOnNonInstance) {
    auto get = EvaluatorTestHelper::run("var x = 1; x.y;");
    EXPECT_NE(get.err.find("Only instances have properties."), std::string::npos);

    auto set = EvaluatorTestHelper::run("var x = 1; x.y = 2;");
    EXPECT_NE(set.err.find("Only instances have fields."), std::string::npos);
}

TEST(EvaluatorTest, InheritedMethods) {
    EXPECT_EQ(EvaluatorTestHelper::output("class A { hi() { print \"A\"; } } class B < A {} B().hi();"), "A\n");
}

TEST(EvaluatorTest, SuperclassMustBeClass) {
    auto run = EvaluatorTestHelper::run("var NotClass = 1; class B < NotClass {}");
    EXPECT_NE(run.err.find("Superclass must be a class."), std::string::npos);
}

TEST(EvaluatorTest, SuperDispatchesFromDefiningClass) {
    const char* src =
        "class A { method() { print \"A method\"; } }\n"
        "class B < A {\n"
        "  method() { print \"B method\"; }\n"
        "  test() { super.method(); }\n"
        "}\n"
        "class C < B {}\n"
        "C().test();\n";
    EXPECT_EQ(EvaluatorTestHelper::output(src), "A method\n");
}

TEST(EvaluatorTest, SuperChainThroughThreeLevels) {
    const char* src =
        "class A { say() { return \"A\"; } }\n"
        "class B < A { say() { return \"B\" + super.say(); } }\n"
        "class C < B { say() { return \"C\" + super.say(); } }\n"
        "print C().say();\n";
    EXPECT_EQ(EvaluatorTestHelper::output(src), "CBA\n");
}

TEST(EvaluatorTest, SuperInitializer) {
    const char* src =
        "class A { init(n) { this.n = n; } }\n"
        "class B < A { init() { super.init(5); this.m = this.n * 2; } }\n"
        "var b = B();\n"
        "print b.n; print b.m;\n";
    EXPECT_EQ(EvaluatorTestHelper::output(src), "5\n10\n");
}

TEST(EvaluatorTest, UndefinedSuperMethod) {
    auto run = EvaluatorTestHelper::run("class A {} class B < A { m() { super.m(); } } B().m();");
    EXPECT_NE(run.err.find("Undefined property 'm'."), std::string::npos);
}

TEST(EvaluatorTest, InstancesCompareByIdentity) {
    EXPECT_EQ(EvaluatorTestHelper::output("class A {} var a = A(); var b = a; print a == b; print A() == A();"),
        "true\nfalse\n");
}

// ============================================================================
// PROGRAM-LEVEL BEHAVIOR
// ============================================================================

TEST(EvaluatorTest, RuntimeErrorStopsExecution) {
    auto run = EvaluatorTestHelper::run("print 1; print nil + 1; print 2;");
    EXPECT_EQ(run.out, "1\n");
    EXPECT_EQ(run.exit_code, 70);
}

TEST(EvaluatorTest, StaticErrorPreventsExecution) {
    auto run = EvaluatorTestHelper::run("print 1;\nprint (2;");
    EXPECT_EQ(run.out, "");
    EXPECT_EQ(run.exit_code, 65);
}

TEST(EvaluatorTest, RerunOnFreshEvaluatorIsIdentical) {
    const char* src =
        "var n = 0;\n"
        "fun bump() { n = n + 1; return n; }\n"
        "class K { init() { this.v = bump(); } }\n"
        "for (var i = 0; i < 3; i = i + 1) print K().v;\n";
    auto first = EvaluatorTestHelper::run(src);
    auto second = EvaluatorTestHelper::run(src);
    EXPECT_EQ(first.out, "1\n2\n3\n");
    EXPECT_EQ(first.out, second.out);
    EXPECT_EQ(first.exit_code, second.exit_code);
}

TEST(EvaluatorTest, ClosureScopeReleasedWithEvaluator) {
    std::weak_ptr<Environment> closure_scope;
    {
        std::ostringstream out, err;
        ErrorReporter reporter(err);
        Evaluator evaluator(reporter, out);
        lox::cli::run_source(
            "fun outer() { var n = 1; fun inner() { return n; } return inner; }\n"
            "var f = outer();\n",
            "test.lox", evaluator, reporter);

        Value f = evaluator.globals()->get(Token(TokenType::IDENTIFIER, "f", TokenLocation("test.lox", 2, 5, 1)));
        ASSERT_TRUE(std::holds_alternative<FunctionPtr>(f));
        closure_scope = std::get<FunctionPtr>(f)->closure;
        EXPECT_FALSE(closure_scope.expired());
    }
    // outer's call scope holds inner, whose closure is that scope
    EXPECT_TRUE(closure_scope.expired());
}

TEST(EvaluatorTest, InstanceHoldingOwnMethodReleasedWithEvaluator) {
    std::weak_ptr<InstanceValue> instance;
    {
        std::ostringstream out, err;
        ErrorReporter reporter(err);
        Evaluator evaluator(reporter, out);
        lox::cli::run_source(
            "class A { m() { return this; } }\n"
            "var a = A();\n"
            "a.self = a.m;\n",
            "test.lox", evaluator, reporter);

        Value a = evaluator.globals()->get(Token(TokenType::IDENTIFIER, "a", TokenLocation("test.lox", 2, 5, 1)));
        ASSERT_TRUE(std::holds_alternative<InstancePtr>(a));
        instance = std::get<InstancePtr>(a);
    }
    EXPECT_TRUE(instance.expired());
}

TEST(EvaluatorTest, FunctionsOutliveTheirProgram) {
    std::ostringstream out, err;
    ErrorReporter reporter(err);
    Evaluator evaluator(reporter, out);

    lox::cli::run_source("fun greet(name) { return \"hi \" + name; }", "a.lox", evaluator, reporter);
    // the first program's AST is gone; the function body must still be usable
    lox::cli::run_source("print greet(\"bob\");", "b.lox", evaluator, reporter);
    EXPECT_EQ(out.str(), "hi bob\n");
}
