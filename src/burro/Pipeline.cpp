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

#include "Pipeline.hpp"
#include "Lexer.hpp"
#include "Benchmark.hpp"

#include <utf8.h>

[[nodiscard]] Compilation compile(const File& f, const FontProvider& fonts)
{
	BenchmarkScope total{"Compile " + f.name};

	if (const auto invalid = utf8::find_invalid(f.content.begin(), f.content.end()); invalid != f.content.end()) [[unlikely]]
		throw LexError(f, "Invalid UTF-8 sequence", static_cast<std::size_t>(invalid - f.content.begin()));

	std::vector<Token> tokens;
	{
		BenchmarkScope bench{"Lexing"};
		tokens = Lexer(f).lex();
	}

	std::optional<std::pair<Document, VariableTable>> parsed;
	{
		BenchmarkScope bench{"Parsing"};
		parsed.emplace(Parser(f).parse(tokens));
	}

	BenchmarkScope bench{"Layout"};
	LayoutResult layout = Layout(parsed->first, fonts).run();

	return Compilation{
		.doc = std::move(parsed->first),
		.vars = std::move(parsed->second),
		.layout = std::move(layout),
	};
}
