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

#ifndef BURRO_UTIL_HPP
#define BURRO_UTIL_HPP

#include <string>
#include <string_view>
#include <cstdint>
#include <source_location>
#include <array>
#include <optional>
#include <utility>

namespace Colors
{
	extern bool enabled;

	extern const std::string_view reset;
	extern const std::string_view bold;
	extern const std::string_view red;
	extern const std::string_view green;
	extern const std::string_view yellow;
	extern const std::string_view blue;
	extern const std::string_view magenta;
} // Colors

/**
 * @brief Represents a file to be compiled
 */
struct File
{
	std::string name; ///< File's name (for displaying)
	std::string_view content; ///< File's content

	/**
	 * @brief Constructor
	 *
	 * @param _name File's name (for displaying)
	 * @param _content File's content
	 */
	[[nodiscard]] File(const std::string& _name, const std::string_view& _content) noexcept:
		name(_name), content(_content) {}

	/**
	 * @brief Gets line starting from `start`
	 *
	 * @param start Start position of line
	 * @returns The line starting at `start`
	 */
	[[nodiscard]] std::string_view get_line(std::size_t start) const noexcept;
};

/**
 * @brief Gets line and column of a position
 *
 * @param f File
 * @param pos Offset in f's content
 * @returns {line, column}, both starting at 0
 */
[[nodiscard]] std::pair<std::size_t, std::size_t> getPos(const File& f, std::size_t pos) noexcept;

/**
 * @brief Get an error message
 *
 * @param f File to print the error for
 * @param category Error category
 * @param msg Error message
 * @param pos Error's position
 * @param count Number of characters to highlight after pos
 * @param color Color of the highlight
 * @returns Error message as a string
 */
[[nodiscard]] std::string getErrorMessage(const File& f,
		const std::string_view& category, const std::string_view& msg,
		std::size_t pos, std::size_t count = 1, std::string_view color = Colors::red);

/**
 * @brief Error exception
 *
 * Thrown when there is an error
 */
class Error
{
protected:
	std::string m_msg; ///< Error message

	/**
	 * @brief Constructor for derived errors that format their own message
	 */
	Error() {}
public:
	/**
	 * @brief Constructor
	 *
	 * @param msg Error message
	 * @param loc Location
	 */
	Error(const std::string& msg, const std::source_location& loc = std::source_location::current());

	virtual ~Error() {}

	/**
	 * @brief what()
	 *
	 * @returns Error message
	 */
	virtual std::string what() const throw();
};

/**
 * @brief Error located in a source file
 *
 * May be thrown without a location by code that does not know the source,
 * in which case the caller is responsible for calling @ref locate before
 * rethrowing.
 */
class SourceError : public Error
{
	std::string m_category; ///< Error category
	std::string m_message; ///< Raw message, without location
	std::optional<std::pair<std::size_t, std::size_t>> m_loc; ///< Line and column
	std::size_t m_pos = 0; ///< Offset in file
public:
	/**
	 * @brief Constructor for an unlocated error
	 *
	 * @param category Error category
	 * @param msg Error message
	 */
	[[nodiscard]] SourceError(std::string category, std::string msg);

	/**
	 * @brief Constructor
	 *
	 * @param f File the error happened in
	 * @param category Error category
	 * @param msg Error message
	 * @param pos Position in f
	 * @param count Number of characters to highlight
	 */
	[[nodiscard]] SourceError(const File& f, std::string category, std::string msg, std::size_t pos, std::size_t count = 1);

	/**
	 * @brief Sets error's location, does nothing if the error is already located
	 *
	 * @param f File the error happened in
	 * @param pos Position in f
	 * @param count Number of characters to highlight
	 */
	void locate(const File& f, std::size_t pos, std::size_t count = 1);

	[[nodiscard]] bool located() const noexcept { return m_loc.has_value(); }
	[[nodiscard]] const std::string& category() const noexcept { return m_category; }
	[[nodiscard]] const std::string& message() const noexcept { return m_message; }
	[[nodiscard]] std::size_t pos() const noexcept { return m_pos; }

	/**
	 * @brief Gets error's line
	 *
	 * @returns Line number (starting at 1), 0 if unlocated
	 */
	[[nodiscard]] std::size_t line() const noexcept { return m_loc ? m_loc->first + 1 : 0; }

	/**
	 * @brief Gets error's column
	 *
	 * @returns Column number (starting at 1), 0 if unlocated
	 */
	[[nodiscard]] std::size_t column() const noexcept { return m_loc ? m_loc->second + 1 : 0; }
};

#define DEFERROR(__name, __category) \
struct __name : public SourceError \
{ \
	[[nodiscard]] __name(std::string msg): \
		SourceError(__category, std::move(msg)) {} \
	[[nodiscard]] __name(const File& f, std::string msg, std::size_t pos, std::size_t count = 1): \
		SourceError(f, __category, std::move(msg), pos, count) {} \
};

DEFERROR(LexError, "Lex Error")
DEFERROR(ParseError, "Parse Error")
DEFERROR(UndefinedVariableError, "Undefined Variable")
DEFERROR(UndefinedTabError, "Undefined Tab")
DEFERROR(UndefinedTabListError, "Undefined Tab List")
DEFERROR(TabNavigationOutOfRangeError, "Tab Out Of Range")
DEFERROR(TabNestingError, "Tab Nesting")
DEFERROR(NoTabsLoadedError, "No Tabs Loaded")
DEFERROR(StateUnderflowError, "Empty Reset")
DEFERROR(FontResolutionError, "Unknown Font")
DEFERROR(FontMapError, "Font Map Error")

#undef DEFERROR

/**
 * @brief Non-fatal diagnostic
 */
struct Warning
{
	std::string category; ///< Warning category
	std::string message; ///< Warning message
	std::size_t pos; ///< Position in source

	/**
	 * @brief Formats warning
	 *
	 * @param f File the warning happened in
	 * @returns Formatted warning
	 */
	[[nodiscard]] std::string format(const File& f) const;
};

/**
 * @brief Constructs an array in place
 *
 * @param args Elements of the array
 * @tparam T Array's type
 * @returns An array of type T containing args
 */
template <class T, class... Args>
static constexpr auto make_array(Args&&... args) noexcept
{
	return std::array<T, sizeof...(Args)>{std::forward<Args>(args)...};
}

/**
 * @brief Removes leading and trailing blanks
 *
 * @param s String to trim
 * @returns Trimmed view of s
 */
[[nodiscard]] std::string_view trim(std::string_view s) noexcept;

/**
 * @brief Checks if character can start an identifier
 */
[[nodiscard]] constexpr bool isIdentifierStart(char c) noexcept
{
	return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
}

/**
 * @brief Checks if character can be part of an identifier
 */
[[nodiscard]] constexpr bool isIdentifier(char c) noexcept
{
	return isIdentifierStart(c) || (c >= '0' && c <= '9');
}

#endif // BURRO_UTIL_HPP
