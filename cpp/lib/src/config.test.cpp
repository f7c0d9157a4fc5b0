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

#include <pkgformula/config.hpp>

#include <catch2/catch.hpp>

using namespace pkgformula;

TEST_CASE("Configuration defaults")
{
	Config config;
	CHECK(config.getInteger("pkgformula::resolver::max-steps") == 100000);
	CHECK_FALSE(config.getBool("debug::resolver"));
	CHECK(config.getBool("pkgformula::console::show-graph"));
	CHECK(config.getPath("pkgformula::directory::configuration::main") ==
			"/etc/pkgformula/pkgformula.conf");
	CHECK(config.getPath("pkgformula::directory::log") == "/var/log/pkgformula.log");
	CHECK_THROWS_AS(config.getString("no::such::option"), Exception);
}

TEST_CASE("Configuration text")
{
	Config config;

	SECTION("simple and nested statements")
	{
		config.readText(
				"// resolver settings\n"
				"pkgformula::resolver::max-steps \"50\";\n"
				"pkgformula\n"
				"{\n"
				"  # nested\n"
				"  Repository \"/srv/opam\";\n"
				"  log { enable \"yes\"; };\n"
				"};\n");
		CHECK(config.getInteger("pkgformula::resolver::max-steps") == 50);
		CHECK(config.getString("pkgformula::repository") == "/srv/opam");
		CHECK(config.getBool("pkgformula::log::enable"));
	}
	SECTION("clearing")
	{
		config.readText("#clear pkgformula::directory;");
		CHECK(config.getString("pkgformula::directory").empty());
		CHECK(config.getString("pkgformula::directory::log").empty());
		CHECK(config.getString("pkgformula::repository") == ".");
	}
	SECTION("syntax errors")
	{
		CHECK_THROWS_AS(config.readText("quiet \"yes\""), Exception);
		CHECK_THROWS_AS(config.readText("quiet yes;"), Exception);
		CHECK_THROWS_AS(config.readText("pkgformula { quiet \"yes\"; "), Exception);
		CHECK_THROWS_AS(config.readText("quiet \"yes\"; };"), Exception);
		CHECK_THROWS_AS(config.readText("#clear;"), Exception);
		CHECK_THROWS_AS(config.readText("quiet \"y\nes\";"), Exception);
		try
		{
			config.readText("quiet \"yes\";\npkgformula\n{\n  log enable;\n};\n");
			FAIL("no exception");
		}
		catch (const Exception& e)
		{
			CHECK(string(e.what()).find("line 4, character 7") != string::npos);
		}
	}
	SECTION("comment markers inside values")
	{
		config.readText("pkgformula::repository \"//srv/# opam\"; // trailing\n#clear quiet;");
		CHECK(config.getString("pkgformula::repository") == "//srv/# opam");
	}
	SECTION("bad numbers")
	{
		config.setScalar("pkgformula::resolver::max-steps", "many");
		CHECK_THROWS_AS(config.getInteger("pkgformula::resolver::max-steps"), Exception);
	}
	SECTION("unknown options are ignored")
	{
		config.readText("no::such::option \"1\";");
		auto names = config.getScalarOptionNames();
		CHECK(std::find(names.begin(), names.end(), "no::such::option") == names.end());
	}
}

TEST_CASE("Configuration copies are independent")
{
	Config config;
	Config copy(config);
	copy.setScalar("quiet", "yes");
	CHECK(copy.getBool("quiet"));
	CHECK_FALSE(config.getBool("quiet"));

	config = copy;
	CHECK(config.getBool("quiet"));
}
