/* Burro a fixed-layout typesetting compiler
   Copyright © 2023 ef3d0c3e

   This program is free software: you can redistribute it and/or modify
   it under the terms of the GNU Affero General Public License as
   published by the Free Software Foundation, either version 3 of the
   License, or any later version.

   This program is distributed in the hope that it will be useful,
   but WITHOUT ANY WARRANTY; without even the implied warranty of
   MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
   GNU Affero General Public License for more details.

   You should have received a copy of the GNU Affero General Public License
   along with this program.  If not, see <http://www.gnu.org/licenses/>. */

#include "Util.hpp"
#include "../burro/Lexer.hpp"

using namespace std::literals;

[[nodiscard]] static std::vector<Token> lex(std::string_view content, LexerOptions opts = {})
{
	return Lexer(testFile(content), opts).lex();
}

[[nodiscard]] static std::vector<Token::Type> types(const std::vector<Token>& tokens)
{
	std::vector<Token::Type> r;
	for (const auto& tok : tokens)
		r.push_back(tok.type);
	return r;
}

TEST_CASE("Text and newlines", "[Lexer]")
{
	SECTION("Plain text")
	{
		const auto tokens = lex("Hello world");
		REQUIRE(tokens.size() == 1);
		CHECK(tokens[0].type == Token::TEXT);
		CHECK(tokens[0].text == "Hello world");
		CHECK(tokens[0].pos == 0);
	}

	SECTION("A single newline is a space")
	{
		const auto tokens = lex("first\nsecond");
		REQUIRE(tokens.size() == 1);
		CHECK(tokens[0].text == "first second");
	}

	SECTION("Blank lines break paragraphs")
	{
		const auto tokens = lex("first\n\nsecond");
		REQUIRE(types(tokens) == std::vector{Token::TEXT, Token::PARAGRAPH_BREAK, Token::TEXT});
		CHECK(tokens[0].text == "first");
		CHECK(tokens[1].pos == 5);
		CHECK(tokens[2].text == "second");
	}

	SECTION("Many blank lines make a single break")
	{
		const auto tokens = lex("first\n\n  \n\t\n\nsecond");
		REQUIRE(types(tokens) == std::vector{Token::TEXT, Token::PARAGRAPH_BREAK, Token::TEXT});
	}

	SECTION("Windows line endings")
	{
		CHECK(lex("a\r\nb")[0].text == "a b");
		REQUIRE(types(lex("a\r\n\r\nb")) == std::vector{Token::TEXT, Token::PARAGRAPH_BREAK, Token::TEXT});
	}

	SECTION("Leading and trailing blank lines")
	{
		const auto tokens = lex("\n\n\ntext\n\n\n");
		REQUIRE(tokens.size() == 1);
		CHECK(tokens[0].text == "text");
	}

	SECTION("Empty input")
	{
		CHECK(lex("").empty());
		CHECK(lex("\n\n").empty());
	}
}

TEST_CASE("Comments", "[Lexer]")
{
	SECTION("Comment lines produce nothing")
	{
		const auto tokens = lex("a\n; a comment\nb");
		REQUIRE(tokens.size() == 1);
		CHECK(tokens[0].text == "a b");
	}

	SECTION("Indented comments")
	{
		const auto tokens = lex("  ; first\n\t;second\ntext");
		REQUIRE(tokens.size() == 1);
		CHECK(tokens[0].text == "text");
	}

	SECTION("A comment does not separate paragraphs")
	{
		CHECK(types(lex("a\n;c\nb")) == std::vector{Token::TEXT});
	}

	SECTION("Semicolons inside a line are text")
	{
		CHECK(lex("a; b")[0].text == "a; b");
	}

	SECTION("Comments can be kept")
	{
		const auto tokens = lex("a\n; note\nb", LexerOptions{.keep_comments = true});
		REQUIRE(types(tokens) == std::vector{Token::TEXT, Token::COMMENT, Token::TEXT});
		CHECK(tokens[1].text == " note");
		CHECK(tokens[1].pos == 2);
	}
}

TEST_CASE("Commands", "[Lexer]")
{
	SECTION("Command with argument")
	{
		const auto tokens = lex(".bold[x]");
		REQUIRE(types(tokens) == std::vector{Token::DOT, Token::OPEN_BRACKET, Token::TEXT, Token::CLOSE_BRACKET});
		CHECK(tokens[0].text == "bold");
		CHECK(tokens[2].text == "x");
	}

	SECTION("Brace block")
	{
		const auto tokens = lex(".tab{.length[10]}[a]");
		REQUIRE(types(tokens) == std::vector{
			Token::DOT, Token::OPEN_BRACE,
			Token::DOT, Token::OPEN_BRACKET, Token::TEXT, Token::CLOSE_BRACKET,
			Token::CLOSE_BRACE,
			Token::OPEN_BRACKET, Token::TEXT, Token::CLOSE_BRACKET});
		CHECK(tokens[2].text == "length");
	}

	SECTION("Inline argument")
	{
		const auto tokens = lex("a .bold b| c");
		REQUIRE(types(tokens) == std::vector{Token::TEXT, Token::DOT, Token::TEXT, Token::PIPE, Token::TEXT});
		CHECK(tokens[0].text == "a ");
		CHECK(tokens[1].pos == 2);
	}

	SECTION("Dots inside words are text")
	{
		const auto tokens = lex("e.g. 3.14 and end.");
		REQUIRE(tokens.size() == 1);
		CHECK(tokens[0].text == "e.g. 3.14 and end.");
	}

	SECTION("Chained commands")
	{
		const auto tokens = lex(".bold.italic[x]");
		REQUIRE(types(tokens) == std::vector{Token::DOT, Token::DOT, Token::OPEN_BRACKET, Token::TEXT, Token::CLOSE_BRACKET});
		CHECK(tokens[1].text == "italic");
	}
}

TEST_CASE("Escapes", "[Lexer]")
{
	SECTION("Special characters")
	{
		for (const char c : ".[]{}|~\\"sv)
		{
			const std::string src = "\\"s + c;
			const auto tokens = lex(src);
			REQUIRE(tokens.size() == 1);
			CHECK(tokens[0].type == Token::ESCAPE);
			CHECK(tokens[0].text == std::string(1, c));
		}
	}

	SECTION("Other characters keep the backslash")
	{
		const auto tokens = lex("a\\nb\\(");
		REQUIRE(tokens.size() == 1);
		CHECK(tokens[0].text == "a\\nb\\(");
	}

	SECTION("Escaped command")
	{
		const auto tokens = lex("\\.bold[x\\]");
		REQUIRE(types(tokens) == std::vector{Token::ESCAPE, Token::TEXT, Token::OPEN_BRACKET, Token::TEXT, Token::ESCAPE});
		CHECK(tokens[1].text == "bold");
	}

	SECTION("Truncated escape")
	{
		REQUIRE_THROWS_AS(lex("abc\\"), LexError);
	}

	SECTION("Random text")
	{
		// Newlines and `#` would form structure of their own
		const std::string s = GENERATE(take(50, random(1, 64, U"\n\r#")));

		std::string src = "x";
		for (const char c : s)
		{
			if (".[]{}|~\\"sv.find(c) != std::string_view::npos)
				src.push_back('\\');
			src.push_back(c);
		}

		std::string text;
		for (const auto& tok : lex(src))
		{
			REQUIRE((tok.type == Token::TEXT || tok.type == Token::ESCAPE));
			text.append(tok.text);
		}
		CHECK(text == "x" + s);
	}
}

TEST_CASE("Variables", "[Lexer]")
{
	SECTION("Definition and reference")
	{
		const auto tokens = lex("#define(name)(Hello .bold[you]) ~name");
		REQUIRE(types(tokens) == std::vector{Token::VARIABLE_DEFINE, Token::TEXT, Token::VARIABLE_REF});
		CHECK(tokens[0].text == "name");
		CHECK(types(tokens[0].fragment) == std::vector{Token::TEXT, Token::DOT, Token::OPEN_BRACKET, Token::TEXT, Token::CLOSE_BRACKET});
		CHECK(tokens[0].fragment[0].pos == 14);
		CHECK(tokens[2].text == "name");
	}

	SECTION("Parentheses in body")
	{
		const auto tokens = lex("#define(p)((a) \\) b)");
		REQUIRE(tokens.size() == 1);
		REQUIRE(tokens[0].fragment.size() == 3);
		CHECK(tokens[0].fragment[0].text == "(a) ");
		CHECK(tokens[0].fragment[1].type == Token::ESCAPE);
		CHECK(tokens[0].fragment[1].text == ")");
		CHECK(tokens[0].fragment[2].text == " b");
	}

	SECTION("A lone tilde is text")
	{
		CHECK(lex("~ 1")[0].text == "~ 1");
	}

	SECTION("Malformed definitions")
	{
		REQUIRE_THROWS_AS(lex("#define(1x)(a)"), LexError);
		REQUIRE_THROWS_AS(lex("#define(x(a)"), LexError);
		REQUIRE_THROWS_AS(lex("#define(x) (a)"), LexError);
		REQUIRE_THROWS_AS(lex("#define(x)(unterminated"), LexError);
	}

	SECTION("Hash without define")
	{
		CHECK(lex("#1 #defined")[0].text == "#1 #defined");
	}
}

TEST_CASE("Restart", "[Lexer]")
{
	const File f = testFile("a\n\nb");
	Lexer lexer(f);
	const auto first = lexer.lex();
	CHECK_FALSE(lexer.next().has_value());

	lexer.reset();
	CHECK(lexer.lex() == first);
}
