#ifndef TALUSD_STRING_UTILS_HPP
#define TALUSD_STRING_UTILS_HPP

#include <algorithm>
#include <concepts>
#include <locale>
#include <string>


// Strips leading and trailing whitespace.
template<typename InputIterator>
std::string trim(InputIterator begin, InputIterator end, const std::locale& current_locale = {})
requires std::bidirectional_iterator<InputIterator> && std::is_same_v<typename InputIterator::value_type, std::string::value_type>
{
	const auto is_space = [&current_locale](auto character)
	{
		return std::isspace(character, current_locale);
	};

	const auto first = std::find_if_not(begin, end, is_space);
	const auto last = std::find_if_not(std::make_reverse_iterator(end), std::make_reverse_iterator(first), is_space).base();

	return std::string(first, last);
}

inline std::string trim(const std::string& val, const std::locale& current_locale = {})
{
	return trim(std::begin(val), std::end(val), current_locale);
}

#endif //TALUSD_STRING_UTILS_HPP
