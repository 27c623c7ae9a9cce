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

#ifndef BURRO_TESTS_UTIL_HPP
#define BURRO_TESTS_UTIL_HPP

#include <string>
#include <string_view>
#include <random>

#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>
#include <catch2/generators/catch_generators_adapters.hpp>

#include "../burro/Util.hpp"

/**
 * @brief Generates a random unicode string
 * @param mt Random source
 * @param len String length (in codepoint)
 * @param exclude Codepoints that never appear in the result
 */
std::string randomString(std::mt19937& mt, std::size_t len, std::u32string_view exclude = U"");

/**
 * @brief Makes a file for tests
 *
 * @param content Source, must outlive the file
 * @returns File named `test.bur`
 */
inline File testFile(std::string_view content)
{
	return File("test.bur", content);
}

namespace
{
	class StringGenerator : public Catch::Generators::IGenerator<std::string>
	{
		std::mt19937 m_mt;
		std::uniform_int_distribution<std::size_t> m_dist;
		std::u32string m_exclude;

		std::string m_current;
		public:
		StringGenerator(std::size_t lo, std::size_t hi, std::u32string_view exclude):
			m_mt(std::mt19937(std::random_device{}())),
			m_dist(lo, hi),
			m_exclude(exclude)
			{
				static_cast<void>(next());
			}

		const std::string& get() const override { return m_current; }

		bool next() override
		{
			m_current = randomString(m_mt, m_dist(m_mt), m_exclude);
			return true;
		}
	};

	/**
	 * @brief Generator of random unicode strings
	 *
	 * @param lo Minimum length
	 * @param hi Maximum length
	 * @param exclude Codepoints that never appear
	 */
	[[maybe_unused]] Catch::Generators::GeneratorWrapper<std::string> random(std::size_t lo, std::size_t hi, std::u32string_view exclude = U"")
	{
		return Catch::Generators::GeneratorWrapper<std::string>(
				new StringGenerator(lo, hi, exclude)
				);
	}
}

#endif // BURRO_TESTS_UTIL_HPP
