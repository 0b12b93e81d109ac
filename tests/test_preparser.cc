#include <gtest/gtest.h>

#include <sstream>

#include "PytchError.hpp"
#include "lex.hpp"
#include "preparser.hpp"
#include "print_debug.hpp"
#include "scanner.hpp"

using namespace pytch;

static ScanOptions test_options() {
    ScanOptions opts;
    opts.filename = "<test>";
    return opts;
}

// Space-separated kinds of the augmented stream, e.g. "LET IDENT EQUALS INT IN EOF".
static std::string kinds(const std::string& source) {
    Lexation lx = lex(source, test_options());
    std::string out;
    for (const auto& tok : lx.tokens) {
        if (!out.empty()) out += " ";
        out += token_name(tok.type);
    }
    return out;
}

static PytchError expectLexError(const std::string& source, ErrorKind kind) {
    try {
        lex(source, test_options());
    } catch (const PytchError& e) {
        EXPECT_EQ(e.kind(), kind) << e.what();
        return e;
    }
    ADD_FAILURE() << "expected " << error_kind_name(kind) << " for source: " << source;
    return PytchError(kind, "", TokenLocation());
}

// ---- reference layout ----

TEST(PreparserTest, LetBodyOnFollowingLines) {
    const std::string source =
        "let foo =\n"
        "  print(\"calculating foo\")\n"
        "  \"foo\"\n"
        "print(\"the value of foo is \" + foo)\n";

    EXPECT_EQ(kinds(source),
        "LET IDENT EQUALS IDENT LPAREN STRING RPAREN SEMICOLON STRING IN "
        "IDENT LPAREN STRING PLUS IDENT RPAREN EOF");
}

TEST(PreparserTest, SyntheticTokensAreZeroWidthAtTrigger) {
    const std::string source =
        "let foo =\n"
        "  print(\"calculating foo\")\n"
        "  \"foo\"\n"
        "print(foo)\n";
    Lexation lx = lex(source, test_options());

    std::vector<Token> synthetic;
    for (const auto& tok : lx.tokens) {
        if (tok.is_synthetic()) synthetic.push_back(tok);
    }
    ASSERT_EQ(synthetic.size(), 2u);

    EXPECT_EQ(synthetic[0].type, TokenType::SEMICOLON);
    EXPECT_EQ(synthetic[0].line(), 3);
    EXPECT_EQ(synthetic[0].col(), 3);
    EXPECT_EQ(synthetic[0].length(), 0);
    EXPECT_TRUE(synthetic[0].text.empty());
    EXPECT_TRUE(synthetic[0].leading.empty());
    EXPECT_TRUE(synthetic[0].trailing.empty());

    EXPECT_EQ(synthetic[1].type, TokenType::DUMMY_IN);
    EXPECT_EQ(synthetic[1].line(), 4);
    EXPECT_EQ(synthetic[1].col(), 1);
    EXPECT_EQ(synthetic[1].full_width(), 0);
}

TEST(PreparserTest, SameLevelStatementsAreSequenced) {
    EXPECT_EQ(kinds("print(1)\nprint(2)"),
        "IDENT LPAREN INT RPAREN SEMICOLON IDENT LPAREN INT RPAREN EOF");
}

TEST(PreparserTest, SingleLineProducesNoSyntheticTokens) {
    EXPECT_EQ(kinds("f(x) + 1"), "IDENT LPAREN IDENT RPAREN PLUS INT EOF");
}

TEST(PreparserTest, LetBodyAtSameLevel) {
    EXPECT_EQ(kinds("let x = 1\nx"), "LET IDENT EQUALS INT IN IDENT EOF");
}

TEST(PreparserTest, StatementBeforeLetIsSequenced) {
    EXPECT_EQ(kinds("f(1)\nlet x = 1\nx"),
        "IDENT LPAREN INT RPAREN SEMICOLON LET IDENT EQUALS INT IN IDENT EOF");
}

TEST(PreparserTest, BlankAndCommentLinesAreIgnored) {
    EXPECT_EQ(kinds("let x = 1\n\n     # note\n\nx\n"), "LET IDENT EQUALS INT IN IDENT EOF");
}

TEST(PreparserTest, ContinuationLinesAreNotSequenced) {
    EXPECT_EQ(kinds("f(a) +\n  g(b) +\n  h(c)\n"),
        "IDENT LPAREN IDENT RPAREN PLUS IDENT LPAREN IDENT RPAREN PLUS IDENT LPAREN IDENT RPAREN EOF");

    const std::string source =
        "let total =\n"
        "  a\n"
        "    + b\n"
        "    + c\n"
        "total\n";
    EXPECT_EQ(kinds(source), "LET IDENT EQUALS IDENT PLUS IDENT PLUS IDENT IN IDENT EOF");
}

TEST(PreparserTest, ContinuedBindingValueIsNotABody) {
    const std::string source =
        "let x = 1\n"
        "  + 2\n"
        "  + 3\n"
        "x\n";
    EXPECT_EQ(kinds(source), "LET IDENT EQUALS INT PLUS INT PLUS INT IN IDENT EOF");
}

TEST(PreparserTest, BodyLinesAfterThenAreSequenced) {
    const std::string source =
        "if a then\n"
        "  f(1)\n"
        "  g(2)\n"
        "else\n"
        "  h(3)\n"
        "    + 4\n";
    EXPECT_EQ(kinds(source),
        "IF IDENT THEN IDENT LPAREN INT RPAREN SEMICOLON IDENT LPAREN INT RPAREN "
        "ELSE IDENT LPAREN INT RPAREN PLUS INT $endif EOF");
}

// ---- dedent ----

TEST(PreparserTest, DedentClosesDeeperLines) {
    EXPECT_EQ(kinds("let x =\n    1\ny"), "LET IDENT EQUALS INT IN IDENT EOF");
}

TEST(PreparserTest, NestedLetsCloseInOrder) {
    const std::string source =
        "let a =\n"
        "  let b =\n"
        "    1\n"
        "  b\n"
        "a\n";
    EXPECT_EQ(kinds(source), "LET IDENT EQUALS LET IDENT EQUALS INT IN IDENT IN IDENT EOF");
}

TEST(PreparserTest, DedentPastBindingEmitsIn) {
    const std::string source =
        "let a =\n"
        "  let b = 1\n"
        "b\n";
    EXPECT_EQ(kinds(source), "LET IDENT EQUALS LET IDENT EQUALS INT IN IN IDENT EOF");
}

// ---- conditionals ----

TEST(PreparserTest, IfElseEndsWithEndif) {
    const std::string source =
        "if a then\n"
        "  b\n"
        "else\n"
        "  c\n"
        "d\n";
    EXPECT_EQ(kinds(source), "IF IDENT THEN IDENT ELSE IDENT $endif SEMICOLON IDENT EOF");
}

TEST(PreparserTest, ThenOnItsOwnLine) {
    const std::string source =
        "if a\n"
        "then b\n"
        "else c\n";
    EXPECT_EQ(kinds(source), "IF IDENT THEN IDENT ELSE IDENT $endif EOF");
}

TEST(PreparserTest, ElseBindsToInnerIfByIndentation) {
    const std::string source =
        "if a then\n"
        "  if b then c\n"
        "  else d\n";
    EXPECT_EQ(kinds(source), "IF IDENT THEN IF IDENT THEN IDENT ELSE IDENT $endif $endif EOF");
}

TEST(PreparserTest, ElseBindsToOuterIfByIndentation) {
    const std::string source =
        "if a then\n"
        "  if b then c\n"
        "else d\n";
    EXPECT_EQ(kinds(source), "IF IDENT THEN IF IDENT THEN IDENT $endif ELSE IDENT $endif EOF");
}

// ---- brackets ----

TEST(PreparserTest, BracketPinsIndentation) {
    const std::string source =
        "  let x = f(\n"
        "1,\n"
        "2)\n"
        "  x\n";
    Lexation lx = lex(source, test_options());

    std::string out;
    bool inside = false;
    for (const auto& tok : lx.tokens) {
        if (tok.type == TokenType::LPAREN) inside = true;
        if (tok.type == TokenType::RPAREN) inside = false;
        EXPECT_FALSE(inside && tok.is_synthetic()) << "synthetic token inside brackets at " << tok.loc.to_string();
        if (!out.empty()) out += " ";
        out += token_name(tok.type);
    }
    EXPECT_EQ(out, "LET IDENT EQUALS IDENT LPAREN INT COMMA INT RPAREN IN IDENT EOF");
}

TEST(PreparserTest, ArgumentsOnSeparateLines) {
    const std::string source =
        "f(\n"
        "  a,\n"
        "  b\n"
        ")\n"
        "g\n";
    EXPECT_EQ(kinds(source), "IDENT LPAREN IDENT COMMA IDENT RPAREN SEMICOLON IDENT EOF");
}

TEST(PreparserTest, CloseBracketUnwindsOpenConstructs) {
    EXPECT_EQ(kinds("f(let y = 1)"), "IDENT LPAREN LET IDENT EQUALS INT IN RPAREN EOF");
    EXPECT_EQ(kinds("f(if a then b else c) + 1"),
        "IDENT LPAREN IF IDENT THEN IDENT ELSE IDENT $endif RPAREN PLUS INT EOF");
}

TEST(PreparserTest, LayoutStillAppliesToConstructsInsideBrackets) {
    EXPECT_EQ(kinds("f(let y = 1\ny)"), "IDENT LPAREN LET IDENT EQUALS INT IN IDENT RPAREN EOF");
}

TEST(PreparserTest, BracketEntriesHaveLevelZero) {
    Scanner scanner("  f(x)", test_options());
    Preparser preparser(scanner, test_options());

    EXPECT_EQ(preparser.next().type, TokenType::IDENTIFIER);
    ASSERT_EQ(preparser.stack().size(), 1u);
    EXPECT_EQ(preparser.stack().back().construct, ConstructKind::LINE_START);
    EXPECT_EQ(preparser.stack().back().indentation_level, 2);

    EXPECT_EQ(preparser.next().type, TokenType::LPAREN);
    ASSERT_EQ(preparser.stack().size(), 2u);
    const IndentationStackEntry& top = preparser.stack().back();
    EXPECT_EQ(top.construct, ConstructKind::BRACKET);
    EXPECT_EQ(top.indentation_level, 0);
    EXPECT_EQ(top.line, 1);
    EXPECT_EQ(top.opener.col, 4);
}

// ---- end of input ----

TEST(PreparserTest, EofUnwindsInnermostFirst) {
    EXPECT_EQ(kinds("if c then let x = 1"), "IF IDENT THEN LET IDENT EQUALS INT IN $endif EOF");

    const std::string source =
        "let a =\n"
        "  let b = 1\n"
        "  b";
    EXPECT_EQ(kinds(source), "LET IDENT EQUALS LET IDENT EQUALS INT IN IDENT IN EOF");
}

TEST(PreparserTest, EmptyInputIsJustEof) {
    EXPECT_EQ(kinds(""), "EOF");
    EXPECT_EQ(kinds("\n  # only a comment\n"), "EOF");
}

TEST(PreparserTest, StackIsEmptyAfterEof) {
    Scanner scanner("let x = 1\nif x then x", test_options());
    Preparser preparser(scanner, test_options());
    auto tokens = preparser.run();

    EXPECT_EQ(tokens.back().type, TokenType::EOF_TOKEN);
    EXPECT_TRUE(preparser.stack().empty());
    EXPECT_TRUE(preparser.finished());
    EXPECT_EQ(preparser.next().type, TokenType::EOF_TOKEN);
}

// ---- errors ----

TEST(PreparserErrorTest, UnmatchedCloseBracket) {
    PytchError e = expectLexError(")", ErrorKind::UnmatchedCloseBracket);
    EXPECT_EQ(e.location().line, 1);
    EXPECT_EQ(e.location().col, 1);

    e = expectLexError("f(1))", ErrorKind::UnmatchedCloseBracket);
    EXPECT_EQ(e.location().col, 5);

    e = expectLexError("a\n  )", ErrorKind::UnmatchedCloseBracket);
    EXPECT_EQ(e.location().line, 2);
    EXPECT_EQ(e.location().col, 3);
}

TEST(PreparserErrorTest, UnclosedBracketReportsEndAndOpener) {
    PytchError e = expectLexError("f(\n  1", ErrorKind::UnclosedBracketAtEof);
    ASSERT_TRUE(e.opener().has_value());
    EXPECT_EQ(e.opener()->line, 1);
    EXPECT_EQ(e.opener()->col, 2);
    // reported where the input ends
    EXPECT_EQ(e.location().line, 2);
    EXPECT_EQ(e.location().col, 4);
}

TEST(PreparserErrorTest, UnclosedBracketReportsInnermost) {
    PytchError e = expectLexError("(\n  (\n", ErrorKind::UnclosedBracketAtEof);
    ASSERT_TRUE(e.opener().has_value());
    EXPECT_EQ(e.opener()->line, 2);
    EXPECT_EQ(e.opener()->col, 3);
}

TEST(PreparserErrorTest, ScannerErrorsPassThrough) {
    PytchError e = expectLexError("let x = 1\nx; y", ErrorKind::IllegalCharacter);
    EXPECT_EQ(e.location().line, 2);
    EXPECT_EQ(e.location().col, 2);
}

TEST(PreparserErrorTest, ErrorIsRethrownOnLaterCalls) {
    Scanner scanner("a\n)\nb", test_options());
    Preparser preparser(scanner, test_options());

    EXPECT_EQ(preparser.next().type, TokenType::IDENTIFIER);
    EXPECT_THROW(preparser.next(), PytchError);
    try {
        preparser.next();
        FAIL() << "expected the stored error again";
    } catch (const PytchError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::UnmatchedCloseBracket);
        EXPECT_EQ(e.location().line, 2);
    }
}

// ---- determinism & options ----

TEST(PreparserTest, ResetGivesTheSameStream) {
    const std::string source =
        "let foo =\n"
        "  if a then b\n"
        "  else c\n"
        "foo\n";
    Scanner scanner(source, test_options());
    Preparser preparser(scanner, test_options());

    auto first = preparser.run();
    preparser.reset();
    auto second = preparser.run();

    ASSERT_EQ(first.size(), second.size());
    for (size_t i = 0; i < first.size(); ++i) {
        EXPECT_EQ(first[i].type, second[i].type) << "at token " << i;
        EXPECT_EQ(first[i].loc.to_string(), second[i].loc.to_string()) << "at token " << i;
    }
    EXPECT_EQ(preparser.raw_width(), source.size());
}

TEST(PreparserTest, ResetClearsStoredError) {
    Scanner scanner(")", test_options());
    Preparser preparser(scanner, test_options());

    EXPECT_THROW(preparser.next(), PytchError);
    preparser.reset();
    EXPECT_THROW(preparser.next(), PytchError);
}

TEST(PreparserTest, PullingOneAtATimeMatchesRun) {
    const std::string source = "let x = f(1,\n  2)\nx + 3\n";
    Scanner a(source, test_options());
    Preparser pa(a, test_options());
    auto all = pa.run();

    Scanner b(source, test_options());
    Preparser pb(b, test_options());
    for (const auto& expected : all) {
        Token t = pb.next();
        EXPECT_EQ(t.type, expected.type);
        EXPECT_EQ(t.value, expected.value);
    }
}

TEST(PreparserTest, TraceOptionLogsStackActions) {
    ScanOptions opts = test_options();
    opts.trace_preparser = true;
    opts.color_diagnostics = false;
    std::ostringstream trace;

    Scanner scanner("let x = 1\nx", opts);
    Preparser preparser(scanner, opts, &trace);
    preparser.run();

    std::string log = trace.str();
    EXPECT_NE(log.find("[preparser] push BINDING"), std::string::npos) << log;
    EXPECT_NE(log.find("[preparser] emit IN at <test>:2:1"), std::string::npos) << log;
    EXPECT_EQ(log.find("\033["), std::string::npos) << "no color codes expected";
}

TEST(PreparserTest, TraceIsSilentByDefault) {
    std::ostringstream trace;
    Scanner scanner("let x = 1\nx", test_options());
    Preparser preparser(scanner, test_options(), &trace);
    preparser.run();

    EXPECT_TRUE(trace.str().empty());
}

// ---- construct catalog ----

TEST(ConstructRuleTest, CatalogEntries) {
    EXPECT_EQ(construct_rule(ConstructKind::BINDING).on_replace, TokenType::DUMMY_IN);
    EXPECT_EQ(construct_rule(ConstructKind::BINDING).on_unwind, TokenType::DUMMY_IN);
    EXPECT_EQ(construct_rule(ConstructKind::CONDITIONAL).on_unwind, TokenType::DUMMY_ENDIF);
    EXPECT_FALSE(construct_rule(ConstructKind::CONDITIONAL).ends_replacement);
    EXPECT_FALSE(construct_rule(ConstructKind::BRACKET).on_unwind.has_value());
    EXPECT_EQ(construct_rule(ConstructKind::LINE_START).on_replace, TokenType::SEMICOLON);
    EXPECT_FALSE(construct_rule(ConstructKind::LINE_START).on_unwind.has_value());

    for (auto kind : {ConstructKind::BINDING, ConstructKind::CONDITIONAL, ConstructKind::BRACKET, ConstructKind::LINE_START}) {
        EXPECT_EQ(construct_rule(kind).construct, kind);
    }
}

TEST(ConstructRuleTest, OpeningTokens) {
    EXPECT_EQ(construct_for(TokenType::LET), ConstructKind::BINDING);
    EXPECT_EQ(construct_for(TokenType::IF), ConstructKind::CONDITIONAL);
    EXPECT_EQ(construct_for(TokenType::LPAREN), ConstructKind::BRACKET);
    EXPECT_FALSE(construct_for(TokenType::DEF).has_value());
    EXPECT_FALSE(construct_for(TokenType::IDENTIFIER).has_value());
}
