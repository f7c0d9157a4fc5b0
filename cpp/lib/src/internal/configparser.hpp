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
#ifndef PKGFORMULA_INTERNAL_CONFIGPARSER_SEEN
#define PKGFORMULA_INTERNAL_CONFIGPARSER_SEEN

#include <functional>

#include <pkgformula/common.hpp>

namespace pkgformula {
namespace internal {

// reads configuration statements:
//   name "value";
//   name { statements };
//   #clear name;
// names inside brackets get the bracket's name and '::' as a prefix
class ConfigParser
{
 public:
	typedef std::function< void (const string& name, const string& value) > ValueHandler;
	typedef std::function< void (const string& name) > ClearHandler;
 private:
	struct Token
	{
		struct Types
		{
			enum Type { Clear, Name, Value, OpeningBracket, ClosingBracket, Semicolon, End, Invalid };
		};
		Types::Type type;
		string text; // for names and values, without quotes
		size_t line;
		size_t column;
	};

	ValueHandler __value_handler;
	ClearHandler __clear_handler;

	static vector< Token > __tokenize(const string& text);
	static string __get_token_description(Token::Types::Type);
	static void __error_out(const Token&, const vector< Token::Types::Type >& expected);
 public:
	ConfigParser(const ValueHandler&, const ClearHandler&);
	void parse(const string& path);
	void parseText(const string& text);
};

} // namespace
} // namespace

#endif
