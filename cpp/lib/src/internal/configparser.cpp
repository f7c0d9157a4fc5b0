/**************************************************************************
*   Copyright (C) 2026 by the pkgformula developers                       *
*                                                                         *
*   This program is free software; you can redistribute it and/or modify  *
*   it under the terms of the GNU General Public License                  *
*   (version 3 or above) as published by the Free Software Foundation.    *
*                                                                         *
*   This program is distributed in the hope that it will be useful,       *
*   but WITHOUT ANY WARRANTY; without even the implied warranty of        *
*   MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the         *
*   GNU General Public License for more details.                          *
*                                                                         *
*   You should have received a copy of the GNU GPL                        *
*   along with this program; if not, write to the                         *
*   Free Software Foundation, Inc.,                                       *
*   51 Franklin St, Fifth Floor, Boston, MA 02110-1301, USA               *
**************************************************************************/
#include <algorithm>
#include <iterator>

#include <common/regex.hpp>

#include <pkgformula/file.hpp>

#include <internal/configparser.hpp>

namespace pkgformula {
namespace internal {

ConfigParser::ConfigParser(const ValueHandler& valueHandler, const ClearHandler& clearHandler)
	: __value_handler(valueHandler), __clear_handler(clearHandler)
{}

void ConfigParser::parse(const string& path)
{
	string text;
	RequiredFile(path, "r").getFile(text);

	try
	{
		parseText(text);
	}
	catch (Exception&)
	{
		fatal2(__("unable to parse the config file '%s'"), path);
	}
}

vector< ConfigParser::Token > ConfigParser::__tokenize(const string& text)
{
	// '# ' and '//' start comments, '#clear' does not
	static const sregex gapRegex = sregex::compile("(?:\\s+|(?:#\\s|//)[^\\n]*)+");
	static const sregex tokenRegex = sregex::compile(
			"(#clear)|((?:[\\w/.-]+::)*[\\w/.-]+)|\"([^\"\\n]*)\"|([{};])");

	vector< Token > result;
	size_t line = 1;
	auto lineStart = text.begin();
	auto current = text.begin();
	auto moveTo = [&line, &lineStart, &current](string::const_iterator position)
	{
		for (; current != position; ++current)
		{
			if (*current == '\n')
			{
				++line;
				lineStart = current + 1;
			}
		}
	};

	smatch m;
	while (true)
	{
		if (regex_search(current, text.end(), m, gapRegex, regex_constants::match_continuous))
		{
			moveTo(m[0].second);
		}
		Token token = { Token::Types::End, string(), line, size_t(current - lineStart) + 1 };
		if (current == text.end())
		{
			result.push_back(token);
			break;
		}
		if (!regex_search(current, text.end(), m, tokenRegex, regex_constants::match_continuous))
		{
			token.type = Token::Types::Invalid;
			result.push_back(token);
			break;
		}

		if (m[1].matched)
		{
			token.type = Token::Types::Clear;
		}
		else if (m[2].matched)
		{
			token.type = Token::Types::Name;
			token.text = m[2].str();
		}
		else if (m[3].matched)
		{
			token.type = Token::Types::Value;
			token.text = m[3].str();
		}
		else
		{
			auto symbol = *m[4].first;
			token.type = (symbol == '{') ? Token::Types::OpeningBracket :
					(symbol == '}') ? Token::Types::ClosingBracket : Token::Types::Semicolon;
		}
		result.push_back(token);
		moveTo(m[0].second);
	}
	return result;
}

void ConfigParser::parseText(const string& text)
{
	typedef Token::Types TT;

	auto tokens = __tokenize(text);
	auto it = tokens.cbegin(); // the last token is End or Invalid, which nothing consumes
	auto consume = [&it](TT::Type type) -> const string&
	{
		if (it->type != type)
		{
			__error_out(*it, { type });
		}
		return (it++)->text;
	};

	vector< string > prefixes = { string() };
	while (true)
	{
		switch (it->type)
		{
			case TT::Clear:
			{
				++it;
				auto name = prefixes.back() + consume(TT::Name);
				consume(TT::Semicolon);
				__clear_handler(name);
				break;
			}
			case TT::Name:
			{
				auto name = prefixes.back() + consume(TT::Name);
				if (it->type == TT::Value)
				{
					__value_handler(name, consume(TT::Value));
					consume(TT::Semicolon);
				}
				else if (it->type == TT::OpeningBracket)
				{
					++it;
					prefixes.push_back(name + "::");
				}
				else
				{
					__error_out(*it, { TT::Value, TT::OpeningBracket });
				}
				break;
			}
			case TT::ClosingBracket:
				if (prefixes.size() == 1)
				{
					__error_out(*it, { TT::Clear, TT::Name, TT::End });
				}
				++it;
				prefixes.pop_back();
				consume(TT::Semicolon);
				break;
			case TT::End:
				if (prefixes.size() != 1)
				{
					__error_out(*it, { TT::Clear, TT::Name, TT::ClosingBracket });
				}
				return;
			default:
				if (prefixes.size() == 1)
				{
					__error_out(*it, { TT::Clear, TT::Name, TT::End });
				}
				__error_out(*it, { TT::Clear, TT::Name, TT::ClosingBracket });
		}
	}
}

string ConfigParser::__get_token_description(Token::Types::Type type)
{
	switch (type)
	{
		case Token::Types::Clear: return __("clear directive ('#clear')");
		case Token::Types::Name: return __("option name (letters, numbers, slashes, points, dashes, double colons allowed)");
		case Token::Types::Value: return __("option value (quoted string)");
		case Token::Types::OpeningBracket: return __("opening curly bracket ('{')");
		case Token::Types::ClosingBracket: return __("closing curly bracket ('}')");
		case Token::Types::Semicolon: return __("semicolon (';')");
		case Token::Types::End: return __("end of the configuration");
		default:
			fatal2i("no description for the configuration token #%d", int(type));
	}
	__builtin_unreachable();
}

void ConfigParser::__error_out(const Token& token, const vector< Token::Types::Type >& expected)
{
	vector< string > descriptions;
	std::transform(expected.begin(), expected.end(), std::back_inserter(descriptions),
			__get_token_description);
	fatal2(__("syntax error: line %zu, character %zu: expected: %s"),
			token.line, token.column, join(__(" or "), descriptions));
}

} // namespace
} // namespace
